#include <gtest/gtest.h>
#include "chart/ChartFrame.hpp"

namespace {

CalendarDate day(int n) { return CalendarDate::fromYmd(2025, 5, 1).addDays(n); }

} // namespace

class ChartFrameTest : public ::testing::Test {
protected:
    ChartLayoutEngine engine;
    ChartFrameBuilder builder{engine};
    TimeSeriesStore store;
    SeriesSnapshot series;
    ColorTable colors;
    std::map<std::string, std::string> keyNames;

    ChartRequest request(Metric metric) {
        ChartRequest req;
        req.provider       = Provider::OpenAI;
        req.metric         = metric;
        req.hasCredentials = true;
        req.series         = &series;
        req.colors         = &colors;
        req.keyNames       = &keyNames;
        req.width          = ChartFrameBuilder::kLegendWidth + 60;
        req.height         = 13;
        return req;
    }

    void loadCost(const std::vector<CostRecord>& costs) {
        store.replace(costs, {});
        series = store.costSeries(Range::ThirtyDays, std::nullopt);
        colors = ColorAssigner(std::vector<Rgb>{{1, 1, 1}, {2, 2, 2}}).assign(store.colorCategories(GroupBy::Model));
    }
};

// ── Panel states ─────────────────────────────────────────────────

TEST_F(ChartFrameTest, ErrorReplacesChart) {
    auto req = request(Metric::Cost);
    req.error = "Costs API error 500: boom";
    auto frame = builder.build(req);
    EXPECT_EQ(frame.state, PanelState::Error);
    EXPECT_EQ(frame.message, "Error loading OpenAI Cost data: Costs API error 500: boom");
}

TEST_F(ChartFrameTest, MissingCredentialsAskForKey) {
    auto req = request(Metric::Usage);
    req.provider = Provider::Anthropic;
    req.hasCredentials = false;
    auto frame = builder.build(req);
    EXPECT_EQ(frame.state, PanelState::NeedsCredentials);
    EXPECT_EQ(frame.message, "Connect an Anthropic Admin API key to view Usage data.");
}

TEST_F(ChartFrameTest, EmptySeriesIsLoadingOrNoData) {
    auto req = request(Metric::Cost);
    req.inFlight = true;
    EXPECT_EQ(builder.build(req).state, PanelState::Loading);

    req.inFlight = false;
    auto frame = builder.build(req);
    EXPECT_EQ(frame.state, PanelState::NoData);
    EXPECT_EQ(frame.message, "No OpenAI Cost data available for the selected window.");
}

TEST_F(ChartFrameTest, TinyPanelReportsNoSpace) {
    loadCost({{day(0), 5.0, std::string("gpt-4")}});

    auto req = request(Metric::Cost);
    req.width = ChartFrameBuilder::kLegendWidth + 3;
    auto narrow = builder.build(req);
    EXPECT_EQ(narrow.state, PanelState::NoSpace);
    EXPECT_EQ(narrow.message, "Not enough space to render cost chart");

    req = request(Metric::Cost);
    req.height = 3;
    EXPECT_EQ(builder.build(req).state, PanelState::NoSpace);
}

// ── Ready frames ─────────────────────────────────────────────────

TEST_F(ChartFrameTest, BarsStackInCategoryOrder) {
    loadCost({{day(0), 2.0, std::string("b-model")},
              {day(0), 4.0, std::string("a-model")},
              {day(1), 6.0, std::string("a-model")}});

    auto frame = builder.build(request(Metric::Cost));
    ASSERT_EQ(frame.state, PanelState::Ready);
    EXPECT_EQ(frame.title, "OpenAI - Daily Cost by Model");
    EXPECT_EQ(frame.barAreaHeight, 10);
    ASSERT_EQ(frame.bars.size(), 2u);

    auto& first = frame.bars[0];
    ASSERT_EQ(first.segments.size(), 2u);
    EXPECT_EQ(first.segments[0].geometry.category, "a-model");
    EXPECT_EQ(first.segments[1].geometry.category, "b-model");
    EXPECT_EQ(first.segments[1].geometry.bottom, first.segments[0].geometry.height);
    EXPECT_EQ(first.totalLabel, "$6");
    EXPECT_EQ(first.dateLabel, "05/01");
    EXPECT_EQ(first.segments[0].color, colors.at("a-model"));
    EXPECT_FALSE(frame.thumb.has_value());
}

TEST_F(ChartFrameTest, OutlierBarIsFlaggedCapped) {
    std::vector<CostRecord> costs;
    for (int d = 0; d < 4; d++)
        costs.push_back({day(d), 10.0, std::string("m")});
    costs.push_back({day(4), 100.0, std::string("m")});
    loadCost(costs);

    auto frame = builder.build(request(Metric::Cost));
    ASSERT_EQ(frame.state, PanelState::Ready);
    EXPECT_DOUBLE_EQ(frame.scale.displayMax, 20.0);
    ASSERT_EQ(frame.bars.size(), 5u);
    EXPECT_TRUE(frame.bars[4].capped);
    EXPECT_FALSE(frame.bars[0].capped);
    EXPECT_EQ(frame.bars[4].segments[0].geometry.height, frame.barAreaHeight);
}

TEST_F(ChartFrameTest, ScrollbarWhenBarsOverflow) {
    std::vector<CostRecord> costs;
    for (int d = 0; d < 20; d++)
        costs.push_back({day(d), 1.0 + d, std::string("m")});
    loadCost(costs);

    auto frame = builder.build(request(Metric::Cost));
    ASSERT_EQ(frame.state, PanelState::Ready);
    ASSERT_TRUE(frame.layout.has_value());
    EXPECT_EQ(frame.totalBars, 20u);
    EXPECT_EQ(frame.layout->endIndex(), 20u);
    ASSERT_TRUE(frame.thumb.has_value());
    EXPECT_EQ(frame.thumb->position + frame.thumb->size, frame.chartWidth);
}

// ── Legend ───────────────────────────────────────────────────────

TEST_F(ChartFrameTest, CostLegendHidesSmallModels) {
    loadCost({{day(0), 0.40, std::string("cheap")},
              {day(0), 12.5, std::string("pricey")}});

    auto frame = builder.build(request(Metric::Cost));
    EXPECT_EQ(frame.legendTitle, "Models (>$1)");
    ASSERT_EQ(frame.legend.size(), 1u);
    EXPECT_EQ(frame.legend[0].key, "pricey");
}

TEST_F(ChartFrameTest, CostLegendShowsEverythingWhenAllAreSmall) {
    loadCost({{day(0), 0.40, std::string("a")},
              {day(0), 0.10, std::string("b")}});

    auto frame = builder.build(request(Metric::Cost));
    EXPECT_EQ(frame.legendTitle, "Models");
    EXPECT_EQ(frame.legend.size(), 2u);
}

TEST_F(ChartFrameTest, UsageLegendResolvesKeyNames) {
    UsageRecord a;
    a.date = day(0);
    a.inputTokens = 1500;
    a.outputTokens = 500;
    a.apiKeyId = "key_named";
    UsageRecord b = a;
    b.apiKeyId = "key_0123456789abcdefXYZ";
    store.replace({}, {a, b});
    series = store.usageSeries(Range::SevenDays, GroupBy::ApiKeys, std::nullopt);
    keyNames["key_named"] = "production";

    auto req = request(Metric::Usage);
    req.groupBy = GroupBy::ApiKeys;
    req.filter  = std::string("key_named");
    auto frame = builder.build(req);

    EXPECT_EQ(frame.title, "OpenAI - Daily Token Usage by API Keys - key_named");
    EXPECT_EQ(frame.legendTitle, "API Keys");
    ASSERT_EQ(frame.legend.size(), 2u);
    EXPECT_EQ(frame.legend[0].label, "key_0123...fXYZ");
    EXPECT_EQ(frame.legend[1].label, "production");
    EXPECT_EQ(frame.legend[1].inputTokens, 1500u);
    EXPECT_EQ(frame.bars[0].totalLabel, "4k");
}

TEST_F(ChartFrameTest, SegmentValuesOnlyWhenTheyFit) {
    loadCost({{day(0), 3.25, std::string("a")}, {day(0), 40.0, std::string("b")}});

    auto req = request(Metric::Cost);
    req.showSegmentValues = true;
    auto frame = builder.build(req);
    ASSERT_EQ(frame.state, PanelState::Ready);
    ASSERT_EQ(frame.bars[0].segments.size(), 2u);
    EXPECT_EQ(frame.bars[0].segments[0].valueLabel, "$3.25");
    EXPECT_EQ(frame.bars[0].segments[1].valueLabel, "$40");
}
