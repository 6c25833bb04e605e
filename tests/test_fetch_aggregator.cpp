#include <gtest/gtest.h>
#include "fetch/FetchAggregator.hpp"
#include "fetch/FetchDispatcher.hpp"
#include "fetch/ProviderSession.hpp"
#include <atomic>
#include <chrono>
#include <thread>

namespace {

CalendarDate day(int n) { return CalendarDate::fromYmd(2025, 7, 1).addDays(n); }

// Canned client: returns the configured data or throws the configured error
struct ScriptedClient : ProviderClient {
    Provider vendor = Provider::OpenAI;
    std::vector<CostRecord> costs;
    UsageFetch usage;
    KeyNameMap names;
    std::optional<std::string> costFailure;
    std::optional<std::string> usageFailure;
    std::optional<std::string> namesFailure;

    std::vector<std::string>* requestedIds = nullptr;

    Provider provider() const override { return vendor; }

    std::vector<CostRecord> fetchCosts(const CalendarDate&) override {
        if (costFailure) throw TransportError("Costs", 500, *costFailure);
        return costs;
    }
    UsageFetch fetchUsage(const CalendarDate&) override {
        if (usageFailure) throw AllSourcesFailedError({*usageFailure});
        return usage;
    }
    KeyNameMap resolveKeyNames(const std::vector<std::string>& ids) override {
        if (requestedIds) *requestedIds = ids;
        if (namesFailure) throw TransportError("Projects", 403, *namesFailure);
        return names;
    }
};

UsageRecord usage(int d, uint64_t in, uint64_t out, std::optional<std::string> key) {
    UsageRecord r;
    r.date = day(d);
    r.inputTokens = in;
    r.outputTokens = out;
    r.model = "m";
    r.apiKeyId = std::move(key);
    return r;
}

FetchAggregator aggregatorFor(const ScriptedClient& script) {
    return FetchAggregator([script](const ProviderCredentials&) {
        return std::make_unique<ScriptedClient>(script);
    }, 30);
}

const ProviderCredentials kCreds{Provider::OpenAI, "sk-test"};

} // namespace

// ── Aggregation ──────────────────────────────────────────────────

TEST(FetchAggregatorTest, RecordsAreSortedAndEmptyUsageDropped) {
    ScriptedClient script;
    script.costs = {{day(2), 1.0, std::string("b")}, {day(0), 2.0, std::string("a")}};
    script.usage.records = {usage(3, 10, 5, std::string("k1")),
                            usage(1, 0, 0, std::string("k1")),
                            usage(0, 7, 0, std::string("k2"))};
    script.names = {{"k1", "prod"}};

    auto outcome = aggregatorFor(script).run(kCreds, day(0));
    EXPECT_EQ(outcome.provider, Provider::OpenAI);
    ASSERT_EQ(outcome.costs.size(), 2u);
    EXPECT_EQ(outcome.costs[0].date, day(0));
    ASSERT_EQ(outcome.usage.size(), 2u);
    EXPECT_EQ(outcome.usage[0].date, day(0));
    EXPECT_EQ(outcome.usage[1].date, day(3));
    EXPECT_EQ(outcome.keyNames.at("k1"), "prod");
    EXPECT_FALSE(outcome.costError.has_value());
    EXPECT_FALSE(outcome.usageError.has_value());
    EXPECT_FALSE(outcome.failed());
}

TEST(FetchAggregatorTest, CostAndUsageErrorsAreIndependent) {
    ScriptedClient script;
    script.costFailure = "cost exploded";
    script.usage.records = {usage(0, 5, 5, std::nullopt)};

    auto outcome = aggregatorFor(script).run(kCreds, day(0));
    ASSERT_TRUE(outcome.costError.has_value());
    EXPECT_NE(outcome.costError->find("cost exploded"), std::string::npos);
    EXPECT_FALSE(outcome.usageError.has_value());
    EXPECT_EQ(outcome.usage.size(), 1u);

    script.costFailure.reset();
    script.usageFailure = "completions: down";
    auto second = aggregatorFor(script).run(kCreds, day(0));
    EXPECT_FALSE(second.costError.has_value());
    ASSERT_TRUE(second.usageError.has_value());
    EXPECT_EQ(second.usageError->rfind("Usage fetch failed: ", 0), 0u);
    EXPECT_TRUE(second.usage.empty());
}

TEST(FetchAggregatorTest, PartialUsageFailureIsNotAnError) {
    ScriptedClient script;
    script.usage.records = {usage(0, 5, 5, std::nullopt), usage(1, 3, 1, std::nullopt)};
    script.usage.partialFailures = {{"embeddings", "HTTP 503"}};

    auto outcome = aggregatorFor(script).run(kCreds, day(0));
    EXPECT_EQ(outcome.usage.size(), 2u);
    EXPECT_FALSE(outcome.usageError.has_value());
    EXPECT_FALSE(outcome.failed());
}

TEST(FetchAggregatorTest, KeyNameFailureIsAppendedAndKeepsUsage) {
    ScriptedClient script;
    script.usage.records = {usage(0, 5, 5, std::string("k1"))};
    script.namesFailure = "no projects";

    auto outcome = aggregatorFor(script).run(kCreds, day(0));
    EXPECT_EQ(outcome.usage.size(), 1u);
    ASSERT_TRUE(outcome.usageError.has_value());
    EXPECT_NE(outcome.usageError->find("API key name fetch failed: "), std::string::npos);
    EXPECT_TRUE(outcome.keyNames.empty());
}

TEST(FetchAggregatorTest, OnlyRealKeyIdsAreResolved) {
    std::vector<std::string> requested;
    ScriptedClient script;
    script.requestedIds = &requested;
    script.usage.records = {usage(0, 1, 1, std::string(" k2 ")),
                            usage(0, 1, 1, std::string("k1")),
                            usage(0, 1, 1, std::string("k1")),
                            usage(0, 1, 1, std::string("unknown")),
                            usage(0, 1, 1, std::string("  ")),
                            usage(0, 1, 1, std::nullopt)};

    aggregatorFor(script).run(kCreds, day(0));
    EXPECT_EQ(requested, (std::vector<std::string>{"k1", "k2"}));
}

TEST(FetchAggregatorTest, NoKeyIdsSkipsResolution) {
    std::vector<std::string> requested = {"sentinel"};
    ScriptedClient script;
    script.requestedIds = &requested;
    script.usage.records = {usage(0, 1, 1, std::nullopt)};

    aggregatorFor(script).run(kCreds, day(0));
    EXPECT_EQ(requested, (std::vector<std::string>{"sentinel"}));
}

TEST(FetchAggregatorTest, FactoryFailureSetsBothErrors) {
    FetchAggregator aggregator([](const ProviderCredentials&) -> std::unique_ptr<ProviderClient> {
        throw std::runtime_error("bad base url");
    }, 30);

    auto outcome = aggregator.run(kCreds, day(0));
    EXPECT_TRUE(outcome.failed());
    EXPECT_EQ(*outcome.costError, "bad base url");
}

TEST(FetchAggregatorTest, AppendErrorJoinsWithSemicolon) {
    std::optional<std::string> err;
    FetchAggregator::appendError(err, "first");
    FetchAggregator::appendError(err, "second");
    EXPECT_EQ(*err, "first; second");
}

TEST(FetchAggregatorTest, WindowStartUsesLookback) {
    FetchAggregator aggregator(nullptr, 30);
    EXPECT_EQ(aggregator.windowStart(), CalendarDate::today().addDays(-30));
}

// ── Session and dispatcher ───────────────────────────────────────

TEST(ProviderSessionTest, SecondFetchWhileInFlightIsDropped) {
    ProviderSession session(Provider::Anthropic);
    session.setCredentials("key");
    EXPECT_TRUE(session.beginFetch());
    EXPECT_FALSE(session.beginFetch());
    EXPECT_TRUE(session.inFlight());

    FetchOutcome outcome;
    outcome.provider = Provider::Anthropic;
    outcome.costs = {{day(0), 3.0, std::string("claude")}};
    outcome.usageError = "Usage fetch failed: boom";
    session.setScrollOffset(Metric::Cost, 4);
    session.apply(std::move(outcome));

    EXPECT_FALSE(session.inFlight());
    EXPECT_TRUE(session.fetched());
    EXPECT_EQ(session.store().costRecords().size(), 1u);
    EXPECT_FALSE(session.error(Metric::Cost).has_value());
    EXPECT_TRUE(session.error(Metric::Usage).has_value());
    EXPECT_EQ(session.scrollOffset(Metric::Cost), kScrollToEnd);

    EXPECT_TRUE(session.beginFetch());
    EXPECT_FALSE(session.error(Metric::Usage).has_value());
}

TEST(ProviderSessionTest, NewKeyRequiresRefetch) {
    ProviderSession session(Provider::OpenAI);
    session.setCredentials("a");
    session.beginFetch();
    session.apply(FetchOutcome{});
    EXPECT_TRUE(session.fetched());

    session.setCredentials("b");
    EXPECT_FALSE(session.fetched());
    EXPECT_EQ(session.credentials()->apiKey, "b");
}

TEST(FetchDispatcherTest, OutcomesAreQueuedForTheUiThread) {
    std::atomic<int> notified{0};
    FetchDispatcher dispatcher([](const ProviderCredentials& c) {
        FetchOutcome o;
        o.provider = c.provider;
        o.costs = {{day(0), 1.0, std::string("x")}};
        return o;
    });
    dispatcher.setNotify([&] { notified++; });

    dispatcher.submit({Provider::OpenAI, "a"});
    dispatcher.submit({Provider::Anthropic, "b"});
    dispatcher.waitIdle();

    auto outcomes = dispatcher.drain();
    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_TRUE(dispatcher.drain().empty());
    EXPECT_EQ(dispatcher.running(), 0u);
    dispatcher.setNotify(nullptr);
}

TEST(FetchDispatcherTest, ThrowingJobBecomesErrorOutcome) {
    FetchDispatcher dispatcher([](const ProviderCredentials&) -> FetchOutcome {
        throw std::runtime_error("worker crashed");
    });
    dispatcher.submit({Provider::Anthropic, "k"});
    dispatcher.waitIdle();

    auto outcomes = dispatcher.drain();
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].provider, Provider::Anthropic);
    EXPECT_TRUE(outcomes[0].failed());
}

TEST(FetchDispatcherTest, DestructionDoesNotWaitForRunningJob) {
    auto started = std::make_shared<std::atomic<bool>>(false);
    auto notified = std::make_shared<std::atomic<int>>(0);

    auto t0 = std::chrono::steady_clock::now();
    {
        FetchDispatcher dispatcher([started](const ProviderCredentials& c) {
            started->store(true);
            std::this_thread::sleep_for(std::chrono::seconds(2));
            FetchOutcome o;
            o.provider = c.provider;
            return o;
        });
        dispatcher.setNotify([notified] { (*notified)++; });
        dispatcher.submit({Provider::OpenAI, "k"});

        while (!started->load())
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        EXPECT_EQ(dispatcher.running(), 1u);
    }
    auto elapsed = std::chrono::steady_clock::now() - t0;

    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
    EXPECT_EQ(notified->load(), 0);
}
