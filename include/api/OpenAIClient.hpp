#pragma once
#include "ProviderClient.hpp"
#include "Paginator.hpp"
#include <array>
#include <memory>

// OpenAI organization Costs and Usage API.
// Usage is split over three endpoints fetched concurrently; key names
// are found by listing projects and then each project's API keys.
class OpenAIClient : public ProviderClient {
public:
    static constexpr std::array<const char*, 3> kUsageEndpoints = {
        "completions", "embeddings", "images"
    };

    OpenAIClient(std::shared_ptr<IHttpTransport> transport, std::string apiKey);

    Provider provider() const override { return Provider::OpenAI; }

    std::vector<CostRecord> fetchCosts(const CalendarDate& start) override;
    UsageFetch fetchUsage(const CalendarDate& start) override;
    KeyNameMap resolveKeyNames(const std::vector<std::string>& ids) override;

    // Single usage endpoint, all pages. Throws on failure.
    std::vector<UsageRecord> fetchUsageEndpoint(const std::string& endpoint,
                                                const CalendarDate& start);

    // Payload decoders (exposed for tests)
    static std::vector<CostRecord>  decodeCostBuckets(const nlohmann::json& buckets);
    static std::vector<UsageRecord> decodeUsageBuckets(const nlohmann::json& buckets);

private:
    std::shared_ptr<IHttpTransport> transport_;
    std::string apiKey_;
    Paginator   paginator_;

    HeaderList authHeaders() const;
    std::vector<std::string> listProjects();
    KeyNameMap projectKeyNames(const std::string& projectId);
};
