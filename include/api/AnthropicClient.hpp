#pragma once
#include "ProviderClient.hpp"
#include "Paginator.hpp"
#include <memory>
#include <optional>

// Anthropic Admin API cost and usage reports.
// Cost amounts arrive as cent strings; key names are looked up per id.
class AnthropicClient : public ProviderClient {
public:
    static constexpr const char* kApiVersion = "2023-06-01";

    AnthropicClient(std::shared_ptr<IHttpTransport> transport, std::string apiKey);

    Provider provider() const override { return Provider::Anthropic; }

    std::vector<CostRecord> fetchCosts(const CalendarDate& start) override;
    UsageFetch fetchUsage(const CalendarDate& start) override;
    KeyNameMap resolveKeyNames(const std::vector<std::string>& ids) override;

    static std::vector<CostRecord>  decodeCostBuckets(const nlohmann::json& buckets);
    static std::vector<UsageRecord> decodeUsageBuckets(const nlohmann::json& buckets);

    // "1234.5" (cents) -> 12.345; empty for non-numeric text
    static std::optional<double> parseCents(const nlohmann::json& amount);

private:
    std::shared_ptr<IHttpTransport> transport_;
    std::string apiKey_;
    Paginator   paginator_;

    HeaderList authHeaders() const;
    std::string keyName(const std::string& id);
};
