#pragma once
#include "data/Records.hpp"
#include <array>
#include <optional>
#include <string>
#include <vector>

// Options bar columns, left to right
enum class OptionsColumn {
    Provider,
    Metric,
    GroupBy,
    Range
};

inline std::string columnLabel(OptionsColumn c) {
    switch (c) {
        case OptionsColumn::Provider: return "Provider";
        case OptionsColumn::Metric:   return "Metric";
        case OptionsColumn::GroupBy:  return "Group By";
        case OptionsColumn::Range:    return "Range";
    }
    return "?";
}

// What the caller has to do after a cursor move
enum class NavEffect {
    None,
    FetchNeeded,        // switched to a provider that was never fetched
    CredentialsNeeded   // switched to a provider without a key
};

// Facts the state machine reads but does not own
struct NavContext {
    std::array<bool, 2> hasCredentials{};   // indexed by providerIndex()
    std::array<bool, 2> fetched{};
    std::vector<std::string> filters;       // categories for the current selection
};

// Selection state of the options bar and filter list. Owned and mutated by
// the input path only; the chart pass reads it once per frame.
class NavigationState {
public:
    static constexpr const char* kAllFilterLabel = "All";

    Provider      provider() const { return provider_; }
    Metric        metric()   const { return metric_; }
    GroupBy       groupBy()  const { return groupBy_; }
    Range         range()    const { return range_; }
    OptionsColumn column()   const { return column_; }

    const std::optional<std::string>& filter() const { return filter_; }
    size_t filterCursor() const { return filterCursor_; }
    bool   groupByExpanded() const { return groupByExpanded_; }

    // Left/Right, wraps around
    void moveColumn(int delta);

    // Up/Down inside the active column, wraps around. While the group-by
    // column is expanded this walks the filter list instead.
    NavEffect moveCursor(int delta, const NavContext& ctx);

    // Enter on the group-by column opens/closes the filter list.
    // Collapsing keeps the selected filter.
    void toggleGroupByExpansion();

    // Drops a filter that is no longer offered (e.g. after a range change)
    // and re-aligns the cursor with the selection.
    void reconcileFilter(const std::vector<std::string>& filters);

    // Startup: move off a provider without credentials when another has them
    void ensureSelectionHasCredentials(const NavContext& ctx);

    // "All" followed by `filters`; cursor 0 is "All"
    static std::vector<std::string> filterMenu(const std::vector<std::string>& filters);

private:
    Provider      provider_ = Provider::OpenAI;
    Metric        metric_   = Metric::Usage;
    GroupBy       groupBy_  = GroupBy::Model;
    Range         range_    = Range::SevenDays;
    OptionsColumn column_   = OptionsColumn::Provider;

    std::optional<std::string> filter_;
    size_t filterCursor_    = 0;
    bool   groupByExpanded_ = false;

    void clearFilter();
    NavEffect moveFilterCursor(int delta, const std::vector<std::string>& filters);
};
