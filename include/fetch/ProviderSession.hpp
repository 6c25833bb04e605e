#pragma once
#include "FetchAggregator.hpp"
#include "chart/ChartLayoutEngine.hpp"
#include "data/TimeSeriesStore.hpp"
#include <optional>
#include <string>

// Everything the dashboard knows about one provider. Mutated only on the
// UI thread: fetch results arrive as a FetchOutcome and replace the
// session's data in one step.
class ProviderSession {
public:
    explicit ProviderSession(Provider provider);

    Provider provider() const { return provider_; }

    // ── Credentials ───────────────────────────────────────────────
    bool hasCredentials() const { return credentials_.has_value(); }
    const std::optional<ProviderCredentials>& credentials() const { return credentials_; }

    // New key: the session has to be fetched again
    void setCredentials(const std::string& apiKey);

    // ── Fetch lifecycle ───────────────────────────────────────────
    bool inFlight() const { return inFlight_; }
    bool fetched() const { return fetched_; }

    // Claims the session for a fetch and clears old errors.
    // False (and no change) when a fetch is already running.
    bool beginFetch();

    // Replaces records, errors and key names with the outcome
    void apply(FetchOutcome outcome);

    // ── Data ──────────────────────────────────────────────────────
    const TimeSeriesStore& store() const { return store_; }
    const KeyNameMap& keyNames() const { return keyNames_; }

    const std::optional<std::string>& error(Metric metric) const {
        return metric == Metric::Cost ? costError_ : usageError_;
    }

    size_t scrollOffset(Metric metric) const {
        return metric == Metric::Cost ? scrollCost_ : scrollUsage_;
    }
    void setScrollOffset(Metric metric, size_t offset) {
        (metric == Metric::Cost ? scrollCost_ : scrollUsage_) = offset;
    }

private:
    Provider provider_;
    std::optional<ProviderCredentials> credentials_;

    bool inFlight_ = false;
    bool fetched_  = false;

    TimeSeriesStore store_;
    KeyNameMap keyNames_;
    std::optional<std::string> costError_;
    std::optional<std::string> usageError_;

    size_t scrollCost_  = kScrollToEnd;
    size_t scrollUsage_ = kScrollToEnd;
};
