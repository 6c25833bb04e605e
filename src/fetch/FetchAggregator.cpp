#include "fetch/FetchAggregator.hpp"
#include "data/GroupKey.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <future>
#include <set>

FetchAggregator::FetchAggregator(ClientFactory factory, int lookbackDays)
    : factory_(std::move(factory)), lookbackDays_(std::max(1, lookbackDays)) {}

CalendarDate FetchAggregator::windowStart() const {
    return CalendarDate::today().addDays(-lookbackDays_);
}

void FetchAggregator::appendError(std::optional<std::string>& target,
                                  const std::string& message) {
    if (target)
        *target += "; " + message;
    else
        target = message;
}

std::vector<std::string> FetchAggregator::keyIdsToResolve(
    const std::vector<UsageRecord>& usage)
{
    std::set<std::string> ids;
    for (auto& r : usage) {
        if (!r.apiKeyId) continue;
        auto id = trimmed(*r.apiKeyId);
        if (id.empty() || id == unknownCategory()) continue;
        ids.insert(id);
    }
    return {ids.begin(), ids.end()};
}

FetchOutcome FetchAggregator::run(const ProviderCredentials& creds) const {
    return run(creds, windowStart());
}

FetchOutcome FetchAggregator::run(const ProviderCredentials& creds,
                                  const CalendarDate& start) const
{
    FetchOutcome outcome;
    outcome.provider = creds.provider;
    const auto label = providerLabel(creds.provider);

    std::unique_ptr<ProviderClient> client;
    try {
        client = factory_(creds);
    } catch (const std::exception& e) {
        outcome.costError  = e.what();
        outcome.usageError = e.what();
        spdlog::error("{}: cannot create client: {}", label, e.what());
        return outcome;
    }
    if (!client) {
        outcome.costError  = "no client for " + label;
        outcome.usageError = outcome.costError;
        return outcome;
    }

    auto t0 = std::chrono::steady_clock::now();
    spdlog::info("{}: fetching from {}", label, start.isoDate());

    auto costTask = std::async(std::launch::async, [&client, start] {
        return client->fetchCosts(start);
    });
    auto usageTask = std::async(std::launch::async, [&client, start] {
        return client->fetchUsage(start);
    });

    // ── Costs ─────────────────────────────────────────────────────
    try {
        outcome.costs = costTask.get();
        std::stable_sort(outcome.costs.begin(), outcome.costs.end(),
            [](const CostRecord& a, const CostRecord& b) { return a.date < b.date; });
    } catch (const std::exception& e) {
        spdlog::warn("{}: cost fetch failed: {}", label, e.what());
        appendError(outcome.costError, e.what());
    }

    // ── Usage ─────────────────────────────────────────────────────
    bool usageOk = false;
    try {
        auto fetched = usageTask.get();

        outcome.usage.reserve(fetched.records.size());
        for (auto& r : fetched.records) {
            if (r.inputTokens == 0 && r.outputTokens == 0) continue;
            outcome.usage.push_back(std::move(r));
        }
        std::stable_sort(outcome.usage.begin(), outcome.usage.end(),
            [](const UsageRecord& a, const UsageRecord& b) { return a.date < b.date; });
        usageOk = true;
    } catch (const std::exception& e) {
        spdlog::warn("{}: usage fetch failed: {}", label, e.what());
        appendError(outcome.usageError, std::string("Usage fetch failed: ") + e.what());
    }

    // ── Key names ─────────────────────────────────────────────────
    if (usageOk) {
        auto ids = keyIdsToResolve(outcome.usage);
        if (!ids.empty()) {
            try {
                outcome.keyNames = client->resolveKeyNames(ids);
            } catch (const std::exception& e) {
                spdlog::warn("{}: key name lookup failed: {}", label, e.what());
                appendError(outcome.usageError,
                            std::string("API key name fetch failed: ") + e.what());
            }
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
    spdlog::info("{}: {} cost / {} usage records, {} key names in {}ms{}",
                 label, outcome.costs.size(), outcome.usage.size(),
                 outcome.keyNames.size(), elapsed,
                 outcome.costError || outcome.usageError ? " (with errors)" : "");
    return outcome;
}
