#include <gtest/gtest.h>
#include "data/SummaryCalculator.hpp"

namespace {

CalendarDate day(int n) { return CalendarDate::fromYmd(2025, 3, 1).addDays(n); }

std::vector<CostRecord> tenDaysOfCost() {
    std::vector<CostRecord> records;
    for (int d = 0; d < 10; d++) {
        records.push_back({day(d), 5.0, std::string("gpt-4")});
        records.push_back({day(d), 1.0, std::string("gpt-3.5")});
    }
    return records;
}

} // namespace

TEST(SummaryCalculatorTest, SevenDayWindowTotalsAndAverage) {
    auto s = SummaryCalculator::summarizeCost(tenDaysOfCost(), Range::SevenDays, std::nullopt);
    EXPECT_DOUBLE_EQ(s.total, 42.0);
    EXPECT_DOUBLE_EQ(s.avgPerDay, 6.0);
    ASSERT_TRUE(s.bounds.has_value());
    EXPECT_EQ(s.bounds->first, day(3));
    EXPECT_EQ(s.bounds->second, day(9));
}

TEST(SummaryCalculatorTest, FilterNarrowsTotal) {
    auto s = SummaryCalculator::summarizeCost(tenDaysOfCost(), Range::SevenDays,
                                              std::string("gpt-4"));
    EXPECT_DOUBLE_EQ(s.total, 35.0);
    EXPECT_DOUBLE_EQ(s.avgPerDay, 5.0);
}

TEST(SummaryCalculatorTest, WeekOverWeekChange) {
    // Current window: 7 days at $6, previous window holds the 3 older days
    auto s = SummaryCalculator::summarizeCost(tenDaysOfCost(), Range::SevenDays, std::nullopt);
    ASSERT_TRUE(s.change.has_value());
    EXPECT_NEAR(s.change->percent, (42.0 - 18.0) / 18.0 * 100.0, 1e-9);
    EXPECT_TRUE(s.change->increased());
}

TEST(SummaryCalculatorTest, NoChangeWithoutPreviousPeriod) {
    std::vector<CostRecord> records = {{day(0), 2.0, std::string("a")},
                                       {day(1), 3.0, std::string("a")}};
    auto s = SummaryCalculator::summarizeCost(records, Range::SevenDays, std::nullopt);
    EXPECT_FALSE(s.change.has_value());
}

TEST(SummaryCalculatorTest, UsageTotalsRequestsAndCacheRate) {
    std::vector<UsageRecord> records(2);
    records[0].date = day(0);
    records[0].inputTokens = 1000;
    records[0].outputTokens = 200;
    records[0].model = "claude";
    records[0].cacheReadTokens = 600;
    records[0].uncachedTokens = 400;
    records[0].requestCount = 10;

    records[1].date = day(1);
    records[1].inputTokens = 500;
    records[1].outputTokens = 300;
    records[1].model = "claude";
    records[1].requestCount = 4;

    auto s = SummaryCalculator::summarizeUsage(records, Range::SevenDays,
                                               GroupBy::Model, std::nullopt);
    EXPECT_EQ(s.inputTokens, 1500u);
    EXPECT_EQ(s.outputTokens, 500u);
    EXPECT_EQ(s.totalTokens(), 2000u);
    EXPECT_NEAR(s.avgTokensPerDay, 2000.0 / 7.0, 1e-9);
    ASSERT_TRUE(s.requests.has_value());
    EXPECT_EQ(*s.requests, 14u);
    EXPECT_DOUBLE_EQ(s.avgRequestsPerDay, 2.0);
    ASSERT_TRUE(s.cacheHitRatePct.has_value());
    EXPECT_DOUBLE_EQ(*s.cacheHitRatePct, 60.0);
}

TEST(SummaryCalculatorTest, UsageWithoutOptionalFieldsOmitsThem) {
    std::vector<UsageRecord> records(1);
    records[0].date = day(0);
    records[0].inputTokens = 10;
    records[0].outputTokens = 10;

    auto s = SummaryCalculator::summarizeUsage(records, Range::ThirtyDays,
                                               GroupBy::ApiKeys, std::nullopt);
    EXPECT_FALSE(s.requests.has_value());
    EXPECT_FALSE(s.cacheHitRatePct.has_value());
    EXPECT_NEAR(s.avgTokensPerDay, 20.0 / 30.0, 1e-9);
}

TEST(SummaryCalculatorTest, ComparePeriodsReportsDecline) {
    std::vector<CostRecord> records;
    for (int d = 0; d < 14; d++)
        records.push_back({day(d), d < 7 ? 4.0 : 2.0, std::string("m")});

    auto change = SummaryCalculator::comparePeriods(
        records, Range::SevenDays,
        [](const CostRecord& r) { return groupKey(r); },
        [](const CostRecord& r) { return r.amount; },
        std::nullopt);
    ASSERT_TRUE(change.has_value());
    EXPECT_DOUBLE_EQ(change->percent, -50.0);
    EXPECT_FALSE(change->increased());
}
