#include "fetch/ProviderSession.hpp"
#include <spdlog/spdlog.h>

ProviderSession::ProviderSession(Provider provider)
    : provider_(provider) {}

void ProviderSession::setCredentials(const std::string& apiKey) {
    credentials_ = ProviderCredentials{provider_, apiKey};
    fetched_ = false;
}

bool ProviderSession::beginFetch() {
    if (inFlight_) {
        spdlog::debug("{}: fetch already running, request dropped",
                      providerLabel(provider_));
        return false;
    }
    inFlight_ = true;
    costError_.reset();
    usageError_.reset();
    return true;
}

void ProviderSession::apply(FetchOutcome outcome) {
    store_.replace(std::move(outcome.costs), std::move(outcome.usage));
    keyNames_   = std::move(outcome.keyNames);
    costError_  = std::move(outcome.costError);
    usageError_ = std::move(outcome.usageError);

    scrollCost_  = kScrollToEnd;
    scrollUsage_ = kScrollToEnd;

    inFlight_ = false;
    fetched_  = true;
}
