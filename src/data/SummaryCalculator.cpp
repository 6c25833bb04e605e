#include "data/SummaryCalculator.hpp"
#include <algorithm>

namespace {

template <typename Record>
std::optional<std::pair<CalendarDate, CalendarDate>> dateBounds(
    const std::vector<Record>& records)
{
    if (records.empty()) return std::nullopt;
    auto [lo, hi] = std::minmax_element(records.begin(), records.end(),
        [](const Record& a, const Record& b) { return a.date < b.date; });
    return std::make_pair(lo->date, hi->date);
}

} // namespace

CostSummary SummaryCalculator::summarizeCost(
    const std::vector<CostRecord>& records, Range range,
    const std::optional<std::string>& filter)
{
    auto keyFn = [](const CostRecord& r) { return groupKey(r); };
    auto filtered = TimeSeriesStore::filterByCategory(
        TimeSeriesStore::recordsInRange(records, range), keyFn, filter);

    CostSummary s;
    for (auto& r : filtered) s.total += r.amount;
    s.avgPerDay = s.total / std::max(1, rangeDays(range));
    s.bounds = dateBounds(filtered);
    s.change = comparePeriods(records, range, keyFn,
                              [](const CostRecord& r) { return r.amount; },
                              filter);
    return s;
}

UsageSummary SummaryCalculator::summarizeUsage(
    const std::vector<UsageRecord>& records, Range range, GroupBy by,
    const std::optional<std::string>& filter)
{
    auto keyFn = [by](const UsageRecord& r) { return groupKey(r, by); };
    auto filtered = TimeSeriesStore::filterByCategory(
        TimeSeriesStore::recordsInRange(records, range), keyFn, filter);

    UsageSummary s;
    uint64_t requests = 0;
    uint64_t cacheRead = 0, uncached = 0;

    for (auto& r : filtered) {
        s.inputTokens  += r.inputTokens;
        s.outputTokens += r.outputTokens;
        if (r.requestCount) requests += *r.requestCount;
        if (r.cacheReadTokens && r.uncachedTokens) {
            cacheRead += *r.cacheReadTokens;
            uncached  += *r.uncachedTokens;
        }
    }

    double days = std::max(1, rangeDays(range));
    s.avgTokensPerDay = static_cast<double>(s.totalTokens()) / days;

    if (requests > 0) {
        s.requests = requests;
        s.avgRequestsPerDay = static_cast<double>(requests) / days;
    }

    if (cacheRead + uncached > 0) {
        s.cacheHitRatePct = static_cast<double>(cacheRead) /
                            static_cast<double>(cacheRead + uncached) * 100.0;
    }

    s.bounds = dateBounds(filtered);
    s.change = comparePeriods(records, range, keyFn,
                              [](const UsageRecord& r) { return r.totalTokens(); },
                              filter);
    return s;
}
