#pragma once
#include "IHttpTransport.hpp"
#include <nlohmann/json.hpp>
#include <string>

// One cursor-paginated listing. Vendors differ only in where the cursor
// comes from and which query parameter carries it back.
struct PageRequest {
    std::string resource;                  // label used in errors and logs
    std::string path;
    QueryParams params;
    HeaderList  headers;
    std::string cursorParam = "page";      // query parameter for the cursor
    std::string cursorField = "next_page"; // response field holding the cursor
};

// Follows `has_more` until the last page or the page cap. Pages are
// requested strictly in cursor order. Any failed page aborts the whole
// listing: nothing from earlier pages is returned.
class Paginator {
public:
    static constexpr int kMaxPages = 30;

    explicit Paginator(IHttpTransport& transport, int maxPages = kMaxPages);

    // Concatenated `data` arrays of every page, as one JSON array.
    // Throws TransportError or DecodeError.
    nlohmann::json fetchAll(const PageRequest& req) const;

    // Single GET decoded as a JSON object. Throws like fetchAll.
    nlohmann::json fetchOne(const std::string& resource,
                            const std::string& path,
                            const QueryParams& params,
                            const HeaderList& headers) const;

private:
    IHttpTransport& transport_;
    int maxPages_;
};
