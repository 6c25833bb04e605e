#include "api/Paginator.hpp"
#include "api/FetchError.hpp"
#include <spdlog/spdlog.h>
#include <optional>

Paginator::Paginator(IHttpTransport& transport, int maxPages)
    : transport_(transport), maxPages_(maxPages) {}

nlohmann::json Paginator::fetchOne(const std::string& resource,
                                   const std::string& path,
                                   const QueryParams& params,
                                   const HeaderList& headers) const
{
    auto res = transport_.get(path, params, headers);
    if (!res.ok()) {
        spdlog::warn("{}: HTTP {} from {}", resource, res.status, path);
        throw TransportError(resource, res.status, res.body);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(res.body);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::warn("{}: unparsable body from {}", resource, path);
        throw DecodeError(resource, e.what(), res.body);
    }

    if (!j.is_object())
        throw DecodeError(resource, "expected a JSON object", res.body);
    return j;
}

nlohmann::json Paginator::fetchAll(const PageRequest& req) const {
    nlohmann::json items = nlohmann::json::array();
    std::optional<std::string> cursor;

    for (int page = 0; page < maxPages_; page++) {
        QueryParams params = req.params;
        if (cursor)
            params.emplace_back(req.cursorParam, *cursor);

        spdlog::debug("{}: page {} {}", req.resource, page + 1, req.path);
        auto j = fetchOne(req.resource, req.path, params, req.headers);

        auto data = j.find("data");
        if (data == j.end() || !data->is_array())
            throw DecodeError(req.resource, "missing data array", j.dump());

        for (auto& item : *data)
            items.push_back(item);

        bool hasMore = j.contains("has_more") && j["has_more"].is_boolean() &&
                       j["has_more"].get<bool>();
        if (!hasMore)
            return items;

        auto next = j.find(req.cursorField);
        if (next == j.end() || !next->is_string() || next->get<std::string>().empty()) {
            spdlog::warn("{}: has_more without a {} cursor, stopping",
                         req.resource, req.cursorField);
            return items;
        }
        cursor = next->get<std::string>();
    }

    spdlog::warn("{}: stopped after {} pages", req.resource, maxPages_);
    return items;
}
