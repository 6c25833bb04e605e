#include "api/HttplibTransport.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>

HttplibTransport::HttplibTransport(std::string baseUrl, int timeoutMs)
    : baseUrl_(std::move(baseUrl)), timeoutMs_(timeoutMs) {}

HttpResponse HttplibTransport::get(const std::string& path,
                                   const QueryParams& params,
                                   const HeaderList& headers)
{
    httplib::Client cli(baseUrl_);
    cli.set_connection_timeout(timeoutMs_ / 1000, (timeoutMs_ % 1000) * 1000);
    cli.set_read_timeout(timeoutMs_ / 1000, (timeoutMs_ % 1000) * 1000);

    httplib::Params query;
    for (auto& [k, v] : params)
        query.emplace(k, v);

    httplib::Headers hdrs;
    for (auto& [k, v] : headers)
        hdrs.emplace(k, v);

    auto res = cli.Get(path, query, hdrs);

    HttpResponse out;
    if (!res) {
        out.status = 0;
        out.body   = "request failed: " + httplib::to_string(res.error());
        spdlog::debug("GET {}{} -> {}", baseUrl_, path, out.body);
        return out;
    }

    out.status = res->status;
    out.body   = res->body;
    spdlog::debug("GET {}{} -> {} ({} bytes)", baseUrl_, path,
                  out.status, out.body.size());
    return out;
}
