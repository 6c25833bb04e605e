#pragma once
#include <string>
#include <utility>
#include <vector>

// Ordered so repeated keys (group_by=model&group_by=api_key_id) survive
using QueryParams = std::vector<std::pair<std::string, std::string>>;
using HeaderList  = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
    int         status = 0;   // 0 when no response was received
    std::string body;         // response body, or the transport error text

    bool ok() const { return status >= 200 && status < 300; }
};

// Abstract GET transport - implement per backend (httplib, test fakes).
// Implementations must be safe to call from several threads at once.
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    virtual HttpResponse get(const std::string& path,
                             const QueryParams& params,
                             const HeaderList& headers) = 0;

    virtual std::string baseUrl() const = 0;
};
