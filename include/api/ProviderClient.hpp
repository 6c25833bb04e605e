#pragma once
#include "FetchError.hpp"
#include "IHttpTransport.hpp"
#include "data/Records.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

using KeyNameMap = std::map<std::string, std::string>;

struct UsageFetch {
    std::vector<UsageRecord>       records;
    std::vector<PartialFetchError> partialFailures;
};

struct ClientConfig {
    std::string openaiBaseUrl    = "https://api.openai.com";
    std::string anthropicBaseUrl = "https://api.anthropic.com";
    int         timeoutMs        = 30000;
};

// Abstract vendor client - implement per provider.
// All methods block; callers run them off the UI thread.
class ProviderClient {
public:
    virtual ~ProviderClient() = default;

    virtual Provider provider() const = 0;

    // Daily cost lines from `start` (UTC midnight) onwards.
    // Throws TransportError / DecodeError.
    virtual std::vector<CostRecord> fetchCosts(const CalendarDate& start) = 0;

    // Daily token usage from `start`. Throws when nothing could be fetched
    // (AllSourcesFailedError where the vendor has several sources).
    virtual UsageFetch fetchUsage(const CalendarDate& start) = 0;

    // Human names for API key ids. Ids that cannot be resolved are absent
    // from the result; throws only when the lookup cannot start at all.
    virtual KeyNameMap resolveKeyNames(const std::vector<std::string>& ids) = 0;
};

// Builds the vendor client for `creds` on an httplib transport
std::unique_ptr<ProviderClient> makeProviderClient(const ProviderCredentials& creds,
                                                   const ClientConfig& config);
