#include "data/TimeSeriesStore.hpp"

std::vector<CalendarDate> SeriesSnapshot::dates() const {
    std::vector<CalendarDate> out;
    out.reserve(daily.size());
    for (auto& [date, cats] : daily)
        out.push_back(date);
    return out;
}

double SeriesSnapshot::dateTotal(const CalendarDate& d) const {
    auto it = daily.find(d);
    if (it == daily.end()) return 0.0;
    double sum = 0.0;
    for (auto& [cat, v] : it->second) sum += v;
    return sum;
}

double SeriesSnapshot::grandTotal() const {
    double sum = 0.0;
    for (auto& [cat, v] : categoryTotals) sum += v;
    return sum;
}

void TimeSeriesStore::replace(std::vector<CostRecord> costs,
                              std::vector<UsageRecord> usage) {
    costs_ = std::move(costs);
    usage_ = std::move(usage);
}

void TimeSeriesStore::clear() {
    costs_.clear();
    usage_.clear();
}

SeriesSnapshot TimeSeriesStore::costSeries(
    Range range, const std::optional<std::string>& filter) const
{
    auto keyFn = [](const CostRecord& r) { return groupKey(r); };
    auto inRange  = recordsInRange(costs_, range);
    auto filtered = filterByCategory(inRange, keyFn, filter);

    SeriesSnapshot snap;
    snap.daily = groupTotals(filtered, keyFn,
                             [](const CostRecord& r) { return r.amount; });

    for (auto& r : filtered)
        snap.categoryTotals[keyFn(r)] += r.amount;
    snap.categories = availableCategories(filtered, keyFn);
    return snap;
}

SeriesSnapshot TimeSeriesStore::usageSeries(
    Range range, GroupBy by, const std::optional<std::string>& filter) const
{
    auto keyFn = [by](const UsageRecord& r) { return groupKey(r, by); };
    auto inRange  = recordsInRange(usage_, range);
    auto filtered = filterByCategory(inRange, keyFn, filter);

    SeriesSnapshot snap;
    snap.daily = groupTotals(filtered, keyFn,
                             [](const UsageRecord& r) { return r.totalTokens(); });

    for (auto& r : filtered) {
        auto key = keyFn(r);
        snap.categoryTotals[key] += static_cast<double>(r.totalTokens());
        auto& split = snap.tokenSplits[key];
        split.input  += r.inputTokens;
        split.output += r.outputTokens;
    }
    snap.categories = availableCategories(filtered, keyFn);
    return snap;
}

std::vector<std::string> TimeSeriesStore::availableFilters(
    Metric metric, GroupBy by, Range range) const
{
    if (metric == Metric::Cost) {
        return availableCategories(recordsInRange(costs_, range),
                                   [](const CostRecord& r) { return groupKey(r); });
    }
    return availableCategories(recordsInRange(usage_, range),
                               [by](const UsageRecord& r) { return groupKey(r, by); });
}

std::set<std::string> TimeSeriesStore::colorCategories(GroupBy usageGroupBy) const {
    std::set<std::string> keys;
    for (auto& r : costs_)
        keys.insert(groupKey(r));
    for (auto& r : usage_)
        keys.insert(groupKey(r, usageGroupBy));
    return keys;
}
