#pragma once
#include "TimeSeriesStore.hpp"
#include <optional>
#include <string>
#include <utility>

// Headline numbers for the summary panel.
struct PeriodChange {
    double percent = 0.0;      // signed; positive means growth
    bool   increased() const { return percent >= 0.0; }
};

struct CostSummary {
    double total      = 0.0;
    double avgPerDay  = 0.0;
    std::optional<std::pair<CalendarDate, CalendarDate>> bounds;
    std::optional<PeriodChange> change;
};

struct UsageSummary {
    uint64_t inputTokens  = 0;
    uint64_t outputTokens = 0;
    double   avgTokensPerDay = 0.0;
    std::optional<uint64_t> requests;
    double   avgRequestsPerDay = 0.0;
    std::optional<double>   cacheHitRatePct;
    std::optional<std::pair<CalendarDate, CalendarDate>> bounds;
    std::optional<PeriodChange> change;

    uint64_t totalTokens() const { return inputTokens + outputTokens; }
};

class SummaryCalculator {
public:
    static CostSummary summarizeCost(const std::vector<CostRecord>& records,
                                     Range range,
                                     const std::optional<std::string>& filter);

    static UsageSummary summarizeUsage(const std::vector<UsageRecord>& records,
                                       Range range, GroupBy by,
                                       const std::optional<std::string>& filter);

    // Compares the window ending at the newest record with the window of
    // equal length immediately before it. Empty when the previous window
    // sums to zero.
    template <typename Record, typename KeyFn, typename ValueFn>
    static std::optional<PeriodChange> comparePeriods(
        const std::vector<Record>& records, Range range,
        KeyFn keyFn, ValueFn valueFn,
        const std::optional<std::string>& filter)
    {
        if (records.empty()) return std::nullopt;

        CalendarDate newest = records.front().date;
        for (auto& r : records)
            if (r.date > newest) newest = r.date;

        int days = rangeDays(range);
        auto cutoff = newest.addDays(-(days - 1));
        auto previousCutoff = cutoff.addDays(-days);

        double current = 0.0, previous = 0.0;
        for (auto& r : records) {
            if (filter && keyFn(r) != *filter) continue;
            double v = static_cast<double>(valueFn(r));
            if (r.date >= cutoff)
                current += v;
            else if (r.date >= previousCutoff)
                previous += v;
        }

        if (previous == 0.0) return std::nullopt;
        return PeriodChange{(current - previous) / previous * 100.0};
    }
};
