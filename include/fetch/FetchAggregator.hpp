#pragma once
#include "api/ProviderClient.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Result of one fetch cycle for one provider. Applied to that provider's
// session as a whole; cost and usage errors are independent.
struct FetchOutcome {
    Provider provider = Provider::OpenAI;
    std::vector<CostRecord>  costs;
    std::vector<UsageRecord> usage;
    KeyNameMap keyNames;
    std::optional<std::string> costError;
    std::optional<std::string> usageError;

    bool failed() const { return costError.has_value() && usageError.has_value(); }
};

using ClientFactory =
    std::function<std::unique_ptr<ProviderClient>(const ProviderCredentials&)>;

// Runs one provider's cost and usage fetches concurrently, then resolves
// API key names for the usage records. Never throws: every failure ends
// up as error text on the outcome.
class FetchAggregator {
public:
    FetchAggregator(ClientFactory factory, int lookbackDays);

    FetchOutcome run(const ProviderCredentials& creds) const;

    // Same as run() with an explicit window start
    FetchOutcome run(const ProviderCredentials& creds, const CalendarDate& start) const;

    // First day requested: today minus the lookback, UTC midnight
    CalendarDate windowStart() const;

    // Appends `message` to `target`, "; "-separated
    static void appendError(std::optional<std::string>& target, const std::string& message);

    // Distinct key ids worth resolving (no blanks, no "unknown"), sorted
    static std::vector<std::string> keyIdsToResolve(const std::vector<UsageRecord>& usage);

private:
    ClientFactory factory_;
    int lookbackDays_;
};
