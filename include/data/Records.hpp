#pragma once
#include "CalendarDate.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>

// Vendors the dashboard can poll
enum class Provider {
    OpenAI,
    Anthropic
};

constexpr std::array<Provider, 2> kAllProviders = {
    Provider::OpenAI, Provider::Anthropic
};

inline size_t providerIndex(Provider p) {
    return p == Provider::OpenAI ? 0 : 1;
}

inline std::string providerLabel(Provider p) {
    switch (p) {
        case Provider::OpenAI:    return "OpenAI";
        case Provider::Anthropic: return "Anthropic";
    }
    return "unknown";
}

// Which chart is displayed
enum class Metric {
    Usage,
    Cost
};

inline std::string metricLabel(Metric m) {
    switch (m) {
        case Metric::Usage: return "Usage";
        case Metric::Cost:  return "Cost";
    }
    return "unknown";
}

// Partition dimension for usage records
enum class GroupBy {
    Model,
    ApiKeys
};

inline std::string groupByLabel(GroupBy g) {
    switch (g) {
        case GroupBy::Model:   return "Model";
        case GroupBy::ApiKeys: return "API Keys";
    }
    return "unknown";
}

// Trailing time window
enum class Range {
    SevenDays,
    ThirtyDays
};

inline int rangeDays(Range r) {
    switch (r) {
        case Range::SevenDays:  return 7;
        case Range::ThirtyDays: return 30;
    }
    return 7;
}

inline std::string rangeLabel(Range r) {
    switch (r) {
        case Range::SevenDays:  return "7d";
        case Range::ThirtyDays: return "30d";
    }
    return "?";
}

// One normalized cost line for one day
struct CostRecord {
    CalendarDate date;
    double       amount = 0.0;          // currency units (USD)
    std::optional<std::string> category; // line item or model
};

// One normalized token-usage line for one day
struct UsageRecord {
    CalendarDate date;
    uint64_t     inputTokens  = 0;
    uint64_t     outputTokens = 0;
    std::optional<std::string> model;
    std::optional<std::string> apiKeyId;
    std::optional<uint64_t>    cacheReadTokens;
    std::optional<uint64_t>    uncachedTokens;
    std::optional<uint64_t>    requestCount;

    uint64_t totalTokens() const { return inputTokens + outputTokens; }
};

// Credentials for one vendor
struct ProviderCredentials {
    Provider    provider = Provider::OpenAI;
    std::string apiKey;
};
