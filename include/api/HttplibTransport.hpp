#pragma once
#include "IHttpTransport.hpp"

// cpp-httplib backed transport. A fresh client is created per request so
// concurrent fan-out calls never share connection state.
class HttplibTransport : public IHttpTransport {
public:
    HttplibTransport(std::string baseUrl, int timeoutMs);

    HttpResponse get(const std::string& path,
                     const QueryParams& params,
                     const HeaderList& headers) override;

    std::string baseUrl() const override { return baseUrl_; }

private:
    std::string baseUrl_;
    int         timeoutMs_;
};
