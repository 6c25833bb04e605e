#include "api/AnthropicClient.hpp"
#include "api/JsonFields.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstdlib>
#include <future>

namespace {
const std::string kBasePath = "/v1/organizations";

// Bucket start, or empty when the timestamp is unusable
std::optional<CalendarDate> bucketDate(const nlohmann::json& bucket) {
    auto start = optionalString(bucket, "starting_at");
    if (!start) return std::nullopt;
    return CalendarDate::parseIso(*start);
}
}

AnthropicClient::AnthropicClient(std::shared_ptr<IHttpTransport> transport,
                                 std::string apiKey)
    : transport_(std::move(transport))
    , apiKey_(std::move(apiKey))
    , paginator_(*transport_) {}

HeaderList AnthropicClient::authHeaders() const {
    return {
        {"x-api-key",         apiKey_},
        {"anthropic-version", kApiVersion},
    };
}

std::optional<double> AnthropicClient::parseCents(const nlohmann::json& amount) {
    if (amount.is_number()) {
        double cents = amount.get<double>();
        if (!std::isfinite(cents)) return std::nullopt;
        return cents / 100.0;
    }
    if (!amount.is_string())
        return std::nullopt;

    const std::string text = amount.get<std::string>();
    if (text.empty()) return std::nullopt;

    char* end = nullptr;
    double cents = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0' || !std::isfinite(cents))
        return std::nullopt;
    return cents / 100.0;
}

// ── Costs ─────────────────────────────────────────────────────────

std::vector<CostRecord> AnthropicClient::fetchCosts(const CalendarDate& start) {
    PageRequest req;
    req.resource = "Anthropic cost report";
    req.path     = kBasePath + "/cost_report";
    req.params   = {
        {"starting_at", start.isoTimestamp()},
        {"group_by[]",  "description"},
    };
    req.headers = authHeaders();

    auto buckets = paginator_.fetchAll(req);
    try {
        return decodeCostBuckets(buckets);
    } catch (const nlohmann::json::exception& e) {
        throw DecodeError(req.resource, e.what(), buckets.dump());
    }
}

std::vector<CostRecord> AnthropicClient::decodeCostBuckets(const nlohmann::json& buckets) {
    std::vector<CostRecord> out;
    for (auto& bucket : buckets) {
        auto date = bucketDate(bucket);
        if (!date) {
            spdlog::debug("Anthropic cost bucket without a usable starting_at skipped");
            continue;
        }
        for (auto& result : bucket.at("results")) {
            auto amount = result.find("amount");
            if (amount == result.end()) continue;

            auto value = parseCents(*amount);
            if (!value || !(*value > 0.0)) continue;

            CostRecord r;
            r.date     = *date;
            r.amount   = *value;
            r.category = optionalString(result, "model");
            out.push_back(std::move(r));
        }
    }
    return out;
}

// ── Usage ─────────────────────────────────────────────────────────

UsageFetch AnthropicClient::fetchUsage(const CalendarDate& start) {
    PageRequest req;
    req.resource = "Anthropic usage report";
    req.path     = kBasePath + "/usage_report/messages";
    req.params   = {
        {"starting_at",  start.isoTimestamp()},
        {"group_by[]",   "model"},
        {"group_by[]",   "api_key_id"},
        {"bucket_width", "1d"},
    };
    req.headers = authHeaders();

    auto buckets = paginator_.fetchAll(req);
    UsageFetch result;
    try {
        result.records = decodeUsageBuckets(buckets);
    } catch (const nlohmann::json::exception& e) {
        throw DecodeError(req.resource, e.what(), buckets.dump());
    }
    return result;
}

std::vector<UsageRecord> AnthropicClient::decodeUsageBuckets(const nlohmann::json& buckets) {
    std::vector<UsageRecord> out;
    for (auto& bucket : buckets) {
        auto date = bucketDate(bucket);
        if (!date) {
            spdlog::debug("Anthropic usage bucket without a usable starting_at skipped");
            continue;
        }
        for (auto& result : bucket.at("results")) {
            uint64_t uncached  = tokenCount(result, "uncached_input_tokens");
            uint64_t cacheRead = tokenCount(result, "cache_read_input_tokens");
            uint64_t cacheWrite = 0;

            auto creation = result.find("cache_creation");
            if (creation != result.end() && creation->is_object()) {
                cacheWrite = tokenCount(*creation, "ephemeral_1h_input_tokens") +
                             tokenCount(*creation, "ephemeral_5m_input_tokens");
            }

            UsageRecord r;
            r.date            = *date;
            r.inputTokens     = uncached + cacheWrite + cacheRead;
            r.outputTokens    = tokenCount(result, "output_tokens");
            r.model           = optionalString(result, "model");
            r.apiKeyId        = optionalString(result, "api_key_id");
            r.cacheReadTokens = cacheRead;
            r.uncachedTokens  = uncached;
            out.push_back(std::move(r));
        }
    }
    return out;
}

// ── Key names ─────────────────────────────────────────────────────

std::string AnthropicClient::keyName(const std::string& id) {
    auto j = paginator_.fetchOne("Anthropic api key " + id,
                                 kBasePath + "/api_keys/" + id, {}, authHeaders());
    auto name = optionalString(j, "name");
    return name ? *name : std::string();
}

KeyNameMap AnthropicClient::resolveKeyNames(const std::vector<std::string>& ids) {
    std::vector<std::pair<std::string, std::future<std::string>>> tasks;
    for (auto& id : ids) {
        tasks.emplace_back(id, std::async(std::launch::async, [this, id] {
            return keyName(id);
        }));
    }

    KeyNameMap resolved;
    for (auto& [id, task] : tasks) {
        try {
            auto name = task.get();
            if (!name.empty())
                resolved[id] = std::move(name);
        } catch (const std::exception& e) {
            spdlog::warn("Anthropic key name for {} skipped: {}", id, e.what());
        }
    }

    spdlog::debug("Anthropic key names: {}/{} resolved", resolved.size(), ids.size());
    return resolved;
}
