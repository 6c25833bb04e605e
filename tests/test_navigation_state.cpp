#include <gtest/gtest.h>
#include "nav/NavigationState.hpp"

class NavigationStateTest : public ::testing::Test {
protected:
    NavigationState nav;
    NavContext ctx;

    void SetUp() override {
        ctx.hasCredentials = {true, true};
        ctx.fetched        = {true, false};
        ctx.filters        = {"claude", "gpt-4"};
    }

    void goTo(OptionsColumn col) {
        while (nav.column() != col) nav.moveColumn(1);
    }
};

TEST_F(NavigationStateTest, Defaults) {
    EXPECT_EQ(nav.provider(), Provider::OpenAI);
    EXPECT_EQ(nav.metric(), Metric::Usage);
    EXPECT_EQ(nav.groupBy(), GroupBy::Model);
    EXPECT_EQ(nav.range(), Range::SevenDays);
    EXPECT_EQ(nav.column(), OptionsColumn::Provider);
    EXPECT_FALSE(nav.filter().has_value());
}

TEST_F(NavigationStateTest, ColumnsWrapBothWays) {
    nav.moveColumn(-1);
    EXPECT_EQ(nav.column(), OptionsColumn::Range);
    nav.moveColumn(1);
    EXPECT_EQ(nav.column(), OptionsColumn::Provider);
    nav.moveColumn(5);
    EXPECT_EQ(nav.column(), OptionsColumn::Metric);
}

TEST_F(NavigationStateTest, SwitchingToUnfetchedProviderNeedsFetch) {
    EXPECT_EQ(nav.moveCursor(1, ctx), NavEffect::FetchNeeded);
    EXPECT_EQ(nav.provider(), Provider::Anthropic);
    EXPECT_EQ(nav.moveCursor(1, ctx), NavEffect::None);
    EXPECT_EQ(nav.provider(), Provider::OpenAI);
}

TEST_F(NavigationStateTest, SwitchingToProviderWithoutKeyNeedsCredentials) {
    ctx.hasCredentials = {true, false};
    EXPECT_EQ(nav.moveCursor(-1, ctx), NavEffect::CredentialsNeeded);
    EXPECT_EQ(nav.provider(), Provider::Anthropic);
}

TEST_F(NavigationStateTest, CostForcesModelGroupingAndClearsFilter) {
    goTo(OptionsColumn::GroupBy);
    nav.moveCursor(1, ctx);
    EXPECT_EQ(nav.groupBy(), GroupBy::ApiKeys);

    nav.toggleGroupByExpansion();
    nav.moveCursor(1, ctx);
    ASSERT_TRUE(nav.filter().has_value());
    nav.toggleGroupByExpansion();

    goTo(OptionsColumn::Metric);
    nav.moveCursor(1, ctx);
    EXPECT_EQ(nav.metric(), Metric::Cost);
    EXPECT_EQ(nav.groupBy(), GroupBy::Model);
    EXPECT_FALSE(nav.filter().has_value());
}

TEST_F(NavigationStateTest, GroupByIsFixedForCost) {
    goTo(OptionsColumn::Metric);
    nav.moveCursor(1, ctx);
    goTo(OptionsColumn::GroupBy);
    nav.moveCursor(1, ctx);
    EXPECT_EQ(nav.groupBy(), GroupBy::Model);
}

TEST_F(NavigationStateTest, FilterListWalksAllThenCategories) {
    goTo(OptionsColumn::GroupBy);
    nav.toggleGroupByExpansion();
    EXPECT_TRUE(nav.groupByExpanded());

    nav.moveCursor(1, ctx);
    EXPECT_EQ(nav.filter(), std::optional<std::string>("claude"));
    EXPECT_EQ(nav.filterCursor(), 1u);

    nav.moveCursor(1, ctx);
    EXPECT_EQ(nav.filter(), std::optional<std::string>("gpt-4"));

    nav.moveCursor(1, ctx);   // wraps to "All"
    EXPECT_FALSE(nav.filter().has_value());
    EXPECT_EQ(nav.filterCursor(), 0u);

    nav.moveCursor(-1, ctx);
    EXPECT_EQ(nav.filter(), std::optional<std::string>("gpt-4"));

    // Collapsing keeps the selection
    nav.toggleGroupByExpansion();
    EXPECT_FALSE(nav.groupByExpanded());
    EXPECT_EQ(nav.filter(), std::optional<std::string>("gpt-4"));
}

TEST_F(NavigationStateTest, ExpansionOnlyFromGroupByColumn) {
    nav.toggleGroupByExpansion();
    EXPECT_FALSE(nav.groupByExpanded());
}

TEST_F(NavigationStateTest, ProviderChangeClearsFilter) {
    goTo(OptionsColumn::GroupBy);
    nav.toggleGroupByExpansion();
    nav.moveCursor(1, ctx);
    nav.toggleGroupByExpansion();
    goTo(OptionsColumn::Provider);
    nav.moveCursor(1, ctx);
    EXPECT_FALSE(nav.filter().has_value());
}

TEST_F(NavigationStateTest, ReconcileDropsVanishedFilter) {
    goTo(OptionsColumn::GroupBy);
    nav.toggleGroupByExpansion();
    nav.moveCursor(2, ctx);
    EXPECT_EQ(nav.filter(), std::optional<std::string>("gpt-4"));

    nav.reconcileFilter({"a", "b", "gpt-4"});
    EXPECT_EQ(nav.filterCursor(), 3u);

    nav.reconcileFilter({"claude"});
    EXPECT_FALSE(nav.filter().has_value());
    EXPECT_EQ(nav.filterCursor(), 0u);
}

TEST_F(NavigationStateTest, RangeCycles) {
    goTo(OptionsColumn::Range);
    nav.moveCursor(1, ctx);
    EXPECT_EQ(nav.range(), Range::ThirtyDays);
    nav.moveCursor(1, ctx);
    EXPECT_EQ(nav.range(), Range::SevenDays);
}

TEST_F(NavigationStateTest, StartupPrefersProviderWithKey) {
    ctx.hasCredentials = {false, true};
    nav.ensureSelectionHasCredentials(ctx);
    EXPECT_EQ(nav.provider(), Provider::Anthropic);

    NavigationState none;
    none.ensureSelectionHasCredentials(NavContext{});
    EXPECT_EQ(none.provider(), Provider::OpenAI);
}

TEST_F(NavigationStateTest, FilterMenuStartsWithAll) {
    auto menu = NavigationState::filterMenu({"x", "y"});
    EXPECT_EQ(menu, (std::vector<std::string>{"All", "x", "y"}));
}
