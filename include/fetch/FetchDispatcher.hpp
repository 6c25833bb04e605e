#pragma once
#include "FetchAggregator.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

// Runs fetch cycles on background threads and hands the outcomes back to
// the UI thread through a queue. The caller guarantees at most one
// submitted job per provider (ProviderSession::beginFetch).
//
// Destruction does not wait for running jobs: they are detached and their
// outcomes discarded, so the job must not reference anything that dies
// with the caller.
class FetchDispatcher {
public:
    using Job    = std::function<FetchOutcome(const ProviderCredentials&)>;
    using Notify = std::function<void()>;

    explicit FetchDispatcher(Job job);
    ~FetchDispatcher();

    FetchDispatcher(const FetchDispatcher&) = delete;
    FetchDispatcher& operator=(const FetchDispatcher&) = delete;

    // Called from the worker after each outcome is queued (UI wake-up)
    void setNotify(Notify notify);

    void submit(const ProviderCredentials& creds);

    // Outcomes completed since the last drain, oldest first
    std::vector<FetchOutcome> drain();

    // Blocks until no job is running
    void waitIdle();

    size_t running() const { return state_->running.load(); }

private:
    // Shared with the workers so a detached job can still finish safely
    struct State {
        explicit State(Job j) : job(std::move(j)) {}

        Job job;

        std::mutex notifyMtx;
        Notify notify;

        std::atomic<size_t> running{0};
        std::mutex mtx;
        std::condition_variable idleCv;
        std::deque<FetchOutcome> outcomes;
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::shared_ptr<State> state_;
    std::vector<Worker> workers_;

    void reapFinished();
};
