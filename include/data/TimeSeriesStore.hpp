#pragma once
#include "Records.hpp"
#include "GroupKey.hpp"
#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

using CategoryTotals = std::map<std::string, double>;
using DailyTotals    = std::map<CalendarDate, CategoryTotals>;

struct TokenSplit {
    uint64_t input  = 0;
    uint64_t output = 0;
};

// Grouped, range- and filter-limited view of one metric, ready for the
// chart and legend. Categories are sorted; a category with a zero total
// on a date is absent from that date's map.
struct SeriesSnapshot {
    DailyTotals daily;
    std::vector<std::string> categories;
    CategoryTotals categoryTotals;
    std::map<std::string, TokenSplit> tokenSplits;  // usage only

    bool empty() const { return daily.empty(); }
    std::vector<CalendarDate> dates() const;
    double dateTotal(const CalendarDate& d) const;
    double grandTotal() const;
};

// Holds one provider's normalized records and answers the range /
// category / grouping queries the dashboard needs each frame.
class TimeSeriesStore {
public:
    TimeSeriesStore() = default;

    // Wholesale replacement; each fetch cycle is a full snapshot
    void replace(std::vector<CostRecord> costs, std::vector<UsageRecord> usage);
    void clear();

    const std::vector<CostRecord>&  costRecords()  const { return costs_; }
    const std::vector<UsageRecord>& usageRecords() const { return usage_; }
    bool hasAnyRecords() const { return !costs_.empty() || !usage_.empty(); }

    // Views used by the chart pass
    SeriesSnapshot costSeries(Range range,
                              const std::optional<std::string>& filter) const;
    SeriesSnapshot usageSeries(Range range, GroupBy by,
                               const std::optional<std::string>& filter) const;

    // Filter menu contents: always computed over the unfiltered,
    // range-limited records for the metric/group-by combination.
    std::vector<std::string> availableFilters(Metric metric, GroupBy by,
                                              Range range) const;

    // Union of cost categories and usage model names over all records.
    // Used for color assignment so one model keeps one color in both charts.
    std::set<std::string> colorCategories(GroupBy usageGroupBy) const;

    // ── Generic operations ─────────────────────────────────────────

    // Keeps records whose date is within `range` days of the newest record
    template <typename Record>
    static std::vector<Record> recordsInRange(const std::vector<Record>& records,
                                              Range range)
    {
        if (records.empty()) return {};

        auto newest = std::max_element(records.begin(), records.end(),
            [](const Record& a, const Record& b) { return a.date < b.date; })->date;
        auto cutoff = newest.addDays(-(rangeDays(range) - 1));

        std::vector<Record> out;
        out.reserve(records.size());
        for (auto& r : records) {
            if (r.date >= cutoff)
                out.push_back(r);
        }
        return out;
    }

    // Keeps records whose key equals `filter`; no filter keeps everything
    template <typename Record, typename KeyFn>
    static std::vector<Record> filterByCategory(const std::vector<Record>& records,
                                                KeyFn keyFn,
                                                const std::optional<std::string>& filter)
    {
        if (!filter) return records;
        std::vector<Record> out;
        for (auto& r : records) {
            if (keyFn(r) == *filter)
                out.push_back(r);
        }
        return out;
    }

    // Per date, per category sum of `valueFn`
    template <typename Record, typename KeyFn, typename ValueFn>
    static DailyTotals groupTotals(const std::vector<Record>& records,
                                   KeyFn keyFn, ValueFn valueFn)
    {
        DailyTotals totals;
        for (auto& r : records)
            totals[r.date][keyFn(r)] += static_cast<double>(valueFn(r));

        for (auto& [date, cats] : totals) {
            for (auto it = cats.begin(); it != cats.end();) {
                if (it->second == 0.0) it = cats.erase(it);
                else ++it;
            }
        }
        return totals;
    }

    // Sorted distinct keys; never contains an empty string
    template <typename Record, typename KeyFn>
    static std::vector<std::string> availableCategories(const std::vector<Record>& records,
                                                        KeyFn keyFn)
    {
        std::set<std::string> keys;
        for (auto& r : records) {
            auto k = keyFn(r);
            if (!k.empty()) keys.insert(std::move(k));
        }
        return {keys.begin(), keys.end()};
    }

private:
    std::vector<CostRecord>  costs_;
    std::vector<UsageRecord> usage_;
};
