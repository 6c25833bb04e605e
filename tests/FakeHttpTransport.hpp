#pragma once
#include "api/IHttpTransport.hpp"
#include <nlohmann/json.hpp>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// Scripted transport for client tests. Responses are queued per path and
// served in order; the last one repeats. Unscripted paths answer 404.
class FakeHttpTransport : public IHttpTransport {
public:
    struct Request {
        std::string path;
        QueryParams params;
        HeaderList  headers;

        std::string param(const std::string& key) const {
            for (auto& [k, v] : params)
                if (k == key) return v;
            return {};
        }
        std::string header(const std::string& key) const {
            for (auto& [k, v] : headers)
                if (k == key) return v;
            return {};
        }
    };

    void respond(const std::string& path, int status, const std::string& body) {
        std::lock_guard lock(mtx_);
        script_[path].push_back({status, body});
    }

    void respondJson(const std::string& path, const nlohmann::json& body) {
        respond(path, 200, body.dump());
    }

    // Single page in the {data, has_more, next_page} envelope
    void respondPage(const std::string& path, const nlohmann::json& data,
                     bool hasMore = false, const std::string& next = "") {
        nlohmann::json page = {{"data", data}, {"has_more", hasMore}};
        if (!next.empty()) {
            page["next_page"] = next;
            page["last_id"]   = next;
        }
        respondJson(path, page);
    }

    HttpResponse get(const std::string& path, const QueryParams& params,
                     const HeaderList& headers) override {
        std::lock_guard lock(mtx_);
        log_.push_back({path, params, headers});

        auto it = script_.find(path);
        if (it == script_.end() || it->second.empty())
            return {404, "{\"error\":\"not found\"}"};

        HttpResponse res = it->second.front();
        if (it->second.size() > 1)
            it->second.pop_front();
        return res;
    }

    std::string baseUrl() const override { return "fake://"; }

    std::vector<Request> requests() const {
        std::lock_guard lock(mtx_);
        return log_;
    }

    size_t requestCount(const std::string& path) const {
        std::lock_guard lock(mtx_);
        size_t n = 0;
        for (auto& r : log_)
            if (r.path == path) n++;
        return n;
    }

private:
    mutable std::mutex mtx_;
    std::map<std::string, std::deque<HttpResponse>> script_;
    std::vector<Request> log_;
};
