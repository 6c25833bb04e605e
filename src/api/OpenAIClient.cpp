#include "api/OpenAIClient.hpp"
#include "api/JsonFields.hpp"
#include <spdlog/spdlog.h>
#include <future>
#include <set>

namespace {
const std::string kBasePath = "/v1/organization";
}

OpenAIClient::OpenAIClient(std::shared_ptr<IHttpTransport> transport,
                           std::string apiKey)
    : transport_(std::move(transport))
    , apiKey_(std::move(apiKey))
    , paginator_(*transport_) {}

HeaderList OpenAIClient::authHeaders() const {
    return {
        {"Authorization", "Bearer " + apiKey_},
        {"Content-Type",  "application/json"},
    };
}

// ── Costs ─────────────────────────────────────────────────────────

std::vector<CostRecord> OpenAIClient::fetchCosts(const CalendarDate& start) {
    PageRequest req;
    req.resource = "OpenAI costs";
    req.path     = kBasePath + "/costs";
    req.params   = {
        {"start_time", std::to_string(start.unixSeconds())},
        {"group_by",   "line_item"},
        {"limit",      "180"},
    };
    req.headers = authHeaders();

    auto buckets = paginator_.fetchAll(req);
    try {
        return decodeCostBuckets(buckets);
    } catch (const nlohmann::json::exception& e) {
        throw DecodeError(req.resource, e.what(), buckets.dump());
    }
}

std::vector<CostRecord> OpenAIClient::decodeCostBuckets(const nlohmann::json& buckets) {
    std::vector<CostRecord> out;
    for (auto& bucket : buckets) {
        auto date = CalendarDate::fromUnixSeconds(bucket.at("start_time").get<int64_t>());
        for (auto& result : bucket.at("results")) {
            CostRecord r;
            r.date     = date;
            r.amount   = result.at("amount").at("value").get<double>();
            r.category = optionalString(result, "line_item");
            out.push_back(std::move(r));
        }
    }
    return out;
}

// ── Usage ─────────────────────────────────────────────────────────

std::vector<UsageRecord> OpenAIClient::fetchUsageEndpoint(const std::string& endpoint,
                                                          const CalendarDate& start)
{
    PageRequest req;
    req.resource = "OpenAI " + endpoint + " usage";
    req.path     = kBasePath + "/usage/" + endpoint;
    req.params   = {
        {"start_time", std::to_string(start.unixSeconds())},
        {"interval",   "1d"},
        {"group_by",   "model"},
        {"group_by",   "api_key_id"},
        {"limit",      "31"},
    };
    req.headers = authHeaders();

    auto buckets = paginator_.fetchAll(req);
    try {
        return decodeUsageBuckets(buckets);
    } catch (const nlohmann::json::exception& e) {
        throw DecodeError(req.resource, e.what(), buckets.dump());
    }
}

std::vector<UsageRecord> OpenAIClient::decodeUsageBuckets(const nlohmann::json& buckets) {
    std::vector<UsageRecord> out;
    for (auto& bucket : buckets) {
        auto date = CalendarDate::fromUnixSeconds(bucket.at("start_time").get<int64_t>());
        for (auto& result : bucket.at("results")) {
            UsageRecord r;
            r.date         = date;
            r.inputTokens  = tokenCount(result, "input_tokens");
            r.outputTokens = tokenCount(result, "output_tokens");
            r.model        = optionalString(result, "model");
            r.apiKeyId     = optionalString(result, "api_key_id");
            r.requestCount = optionalCount(result, "num_model_requests");

            if (auto cached = optionalCount(result, "input_cached_tokens")) {
                r.cacheReadTokens = *cached;
                r.uncachedTokens  = r.inputTokens > *cached ? r.inputTokens - *cached : 0;
            }
            out.push_back(std::move(r));
        }
    }
    return out;
}

UsageFetch OpenAIClient::fetchUsage(const CalendarDate& start) {
    std::vector<std::pair<std::string, std::future<std::vector<UsageRecord>>>> tasks;
    for (auto* endpoint : kUsageEndpoints) {
        std::string name = endpoint;
        tasks.emplace_back(name, std::async(std::launch::async, [this, name, start] {
            return fetchUsageEndpoint(name, start);
        }));
    }

    UsageFetch result;
    std::vector<std::string> errors;
    size_t succeeded = 0;

    for (auto& [name, task] : tasks) {
        try {
            auto records = task.get();
            result.records.insert(result.records.end(),
                                  std::make_move_iterator(records.begin()),
                                  std::make_move_iterator(records.end()));
            succeeded++;
        } catch (const std::exception& e) {
            errors.push_back(name + ": " + e.what());
            result.partialFailures.push_back({name, e.what()});
        }
    }

    if (succeeded == 0)
        throw AllSourcesFailedError(errors);

    for (auto& pf : result.partialFailures)
        spdlog::warn("OpenAI {} usage skipped: {}", pf.source, pf.message);
    return result;
}

// ── Key names ─────────────────────────────────────────────────────

std::vector<std::string> OpenAIClient::listProjects() {
    PageRequest req;
    req.resource    = "OpenAI projects";
    req.path        = kBasePath + "/projects";
    req.params      = {{"limit", "100"}};
    req.headers     = authHeaders();
    req.cursorParam = "after";
    req.cursorField = "last_id";

    auto projects = paginator_.fetchAll(req);
    std::vector<std::string> ids;
    try {
        for (auto& p : projects)
            ids.push_back(p.at("id").get<std::string>());
    } catch (const nlohmann::json::exception& e) {
        throw DecodeError(req.resource, e.what(), projects.dump());
    }
    return ids;
}

KeyNameMap OpenAIClient::projectKeyNames(const std::string& projectId) {
    PageRequest req;
    req.resource    = "OpenAI api keys for " + projectId;
    req.path        = kBasePath + "/projects/" + projectId + "/api_keys";
    req.params      = {{"limit", "100"}};
    req.headers     = authHeaders();
    req.cursorParam = "after";
    req.cursorField = "last_id";

    auto keys = paginator_.fetchAll(req);
    KeyNameMap names;
    try {
        for (auto& k : keys) {
            auto name = optionalString(k, "name");
            if (name && !name->empty())
                names[k.at("id").get<std::string>()] = *name;
        }
    } catch (const nlohmann::json::exception& e) {
        throw DecodeError(req.resource, e.what(), keys.dump());
    }
    return names;
}

KeyNameMap OpenAIClient::resolveKeyNames(const std::vector<std::string>& ids) {
    KeyNameMap resolved;
    if (ids.empty()) return resolved;

    auto projects = listProjects();
    std::set<std::string> wanted(ids.begin(), ids.end());

    std::vector<std::pair<std::string, std::future<KeyNameMap>>> tasks;
    for (auto& projectId : projects) {
        tasks.emplace_back(projectId, std::async(std::launch::async, [this, projectId] {
            return projectKeyNames(projectId);
        }));
    }

    for (auto& [projectId, task] : tasks) {
        try {
            for (auto& [id, name] : task.get()) {
                if (wanted.count(id))
                    resolved[id] = name;
            }
        } catch (const std::exception& e) {
            spdlog::warn("OpenAI key names for project {} skipped: {}", projectId, e.what());
        }
    }

    spdlog::debug("OpenAI key names: {}/{} resolved over {} projects",
                  resolved.size(), wanted.size(), projects.size());
    return resolved;
}
