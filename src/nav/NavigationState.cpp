#include "nav/NavigationState.hpp"
#include <algorithm>

namespace {

// (index + delta) mod len, non-negative
size_t wrap(size_t index, int delta, size_t len) {
    long long n = static_cast<long long>(len);
    long long next = (static_cast<long long>(index) + delta) % n;
    if (next < 0) next += n;
    return static_cast<size_t>(next);
}

template <typename T, size_t N>
T cycle(const std::array<T, N>& values, T current, int delta) {
    auto it = std::find(values.begin(), values.end(), current);
    size_t idx = it == values.end() ? 0 : static_cast<size_t>(it - values.begin());
    return values[wrap(idx, delta, N)];
}

constexpr std::array<OptionsColumn, 4> kColumns = {
    OptionsColumn::Provider, OptionsColumn::Metric,
    OptionsColumn::GroupBy,  OptionsColumn::Range
};
constexpr std::array<Metric, 2>  kMetrics  = {Metric::Usage, Metric::Cost};
constexpr std::array<GroupBy, 2> kGroupBys = {GroupBy::Model, GroupBy::ApiKeys};
constexpr std::array<Range, 2>   kRanges   = {Range::SevenDays, Range::ThirtyDays};

} // namespace

std::vector<std::string> NavigationState::filterMenu(const std::vector<std::string>& filters) {
    std::vector<std::string> menu;
    menu.reserve(filters.size() + 1);
    menu.emplace_back(kAllFilterLabel);
    menu.insert(menu.end(), filters.begin(), filters.end());
    return menu;
}

void NavigationState::clearFilter() {
    filter_.reset();
    filterCursor_ = 0;
}

void NavigationState::moveColumn(int delta) {
    column_ = cycle(kColumns, column_, delta);
}

NavEffect NavigationState::moveCursor(int delta, const NavContext& ctx) {
    switch (column_) {
        case OptionsColumn::Provider: {
            Provider next = cycle(kAllProviders, provider_, delta);
            if (next == provider_) return NavEffect::None;

            provider_ = next;
            clearFilter();

            size_t idx = providerIndex(next);
            if (!ctx.hasCredentials[idx]) return NavEffect::CredentialsNeeded;
            if (!ctx.fetched[idx])        return NavEffect::FetchNeeded;
            return NavEffect::None;
        }

        case OptionsColumn::Metric: {
            Metric next = cycle(kMetrics, metric_, delta);
            if (next == metric_) return NavEffect::None;

            metric_ = next;
            if (metric_ == Metric::Cost)
                groupBy_ = GroupBy::Model;
            clearFilter();
            return NavEffect::None;
        }

        case OptionsColumn::GroupBy:
            if (groupByExpanded_)
                return moveFilterCursor(delta, ctx.filters);

            // Cost is always grouped by model
            if (metric_ == Metric::Usage) {
                GroupBy next = cycle(kGroupBys, groupBy_, delta);
                if (next != groupBy_) {
                    groupBy_ = next;
                    clearFilter();
                }
            }
            return NavEffect::None;

        case OptionsColumn::Range:
            range_ = cycle(kRanges, range_, delta);
            return NavEffect::None;
    }
    return NavEffect::None;
}

NavEffect NavigationState::moveFilterCursor(int delta, const std::vector<std::string>& filters) {
    size_t menuSize = filters.size() + 1;
    filterCursor_ = wrap(std::min(filterCursor_, menuSize - 1), delta, menuSize);

    if (filterCursor_ == 0)
        filter_.reset();
    else
        filter_ = filters[filterCursor_ - 1];
    return NavEffect::None;
}

void NavigationState::toggleGroupByExpansion() {
    if (column_ != OptionsColumn::GroupBy) return;
    groupByExpanded_ = !groupByExpanded_;
}

void NavigationState::reconcileFilter(const std::vector<std::string>& filters) {
    if (!filter_) {
        filterCursor_ = 0;
        return;
    }

    auto it = std::find(filters.begin(), filters.end(), *filter_);
    if (it == filters.end()) {
        clearFilter();
        return;
    }
    filterCursor_ = static_cast<size_t>(it - filters.begin()) + 1;
}

void NavigationState::ensureSelectionHasCredentials(const NavContext& ctx) {
    if (ctx.hasCredentials[providerIndex(provider_)]) return;

    for (auto p : kAllProviders) {
        if (ctx.hasCredentials[providerIndex(p)]) {
            provider_ = p;
            clearFilter();
            return;
        }
    }
}
