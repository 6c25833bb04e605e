#include "fetch/FetchDispatcher.hpp"
#include <spdlog/spdlog.h>

FetchDispatcher::FetchDispatcher(Job job)
    : state_(std::make_shared<State>(std::move(job))) {}

FetchDispatcher::~FetchDispatcher() {
    {
        std::lock_guard lock(state_->notifyMtx);
        state_->notify = nullptr;
    }

    size_t abandoned = 0;
    for (auto& w : workers_) {
        if (!w.thread.joinable()) continue;
        if (w.done->load()) {
            w.thread.join();
        } else {
            w.thread.detach();
            abandoned++;
        }
    }
    if (abandoned > 0)
        spdlog::debug("Dispatcher shut down with {} fetch(es) still running", abandoned);
}

void FetchDispatcher::setNotify(Notify notify) {
    std::lock_guard lock(state_->notifyMtx);
    state_->notify = std::move(notify);
}

void FetchDispatcher::reapFinished() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void FetchDispatcher::submit(const ProviderCredentials& creds) {
    reapFinished();

    state_->running++;
    auto done = std::make_shared<std::atomic<bool>>(false);

    std::thread t([state = state_, creds, done] {
        FetchOutcome outcome;
        try {
            outcome = state->job(creds);
        } catch (const std::exception& e) {
            // Jobs report failures on the outcome; this is a last resort
            spdlog::error("{}: fetch job threw: {}", providerLabel(creds.provider), e.what());
            outcome.provider   = creds.provider;
            outcome.costError  = e.what();
            outcome.usageError = e.what();
        }

        {
            std::lock_guard lock(state->mtx);
            state->outcomes.push_back(std::move(outcome));
            state->running--;
        }
        state->idleCv.notify_all();

        {
            std::lock_guard lock(state->notifyMtx);
            if (state->notify) state->notify();
        }
        done->store(true);
    });

    workers_.push_back({std::move(t), std::move(done)});
}

std::vector<FetchOutcome> FetchDispatcher::drain() {
    std::lock_guard lock(state_->mtx);
    std::vector<FetchOutcome> out(std::make_move_iterator(state_->outcomes.begin()),
                                  std::make_move_iterator(state_->outcomes.end()));
    state_->outcomes.clear();
    return out;
}

void FetchDispatcher::waitIdle() {
    std::unique_lock lock(state_->mtx);
    state_->idleCv.wait(lock, [this] { return state_->running.load() == 0; });
}
