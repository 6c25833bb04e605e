#pragma once
#include <stdexcept>
#include <string>
#include <vector>

// Longest response excerpt embedded in an error message
constexpr size_t kErrorBodyExcerpt = 200;

inline std::string truncateBody(const std::string& body,
                                size_t maxLen = kErrorBodyExcerpt) {
    return body.size() <= maxLen ? body : body.substr(0, maxLen);
}

inline std::string joinMessages(const std::vector<std::string>& parts,
                                const std::string& sep = "; ") {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

class FetchError : public std::runtime_error {
public:
    enum class Kind {
        Transport,          // no response or non-2xx status
        Decode,             // body did not match the expected shape
        AllSourcesFailed    // every usage sub-resource failed
    };

    FetchError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

class TransportError : public FetchError {
public:
    TransportError(const std::string& resource, int status, const std::string& body)
        : FetchError(Kind::Transport,
                     status == 0
                         ? resource + " " + truncateBody(body)
                         : resource + " API error " + std::to_string(status) +
                               ": " + truncateBody(body)),
          status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

class DecodeError : public FetchError {
public:
    DecodeError(const std::string& resource, const std::string& detail,
                const std::string& body)
        : FetchError(Kind::Decode,
                     "Failed to parse " + resource + " response (" + detail +
                         "): " + truncateBody(body)) {}
};

class AllSourcesFailedError : public FetchError {
public:
    explicit AllSourcesFailedError(std::vector<std::string> sourceErrors)
        : FetchError(Kind::AllSourcesFailed,
                     "Failed to fetch usage from any endpoint: " +
                         joinMessages(sourceErrors)),
          sourceErrors_(std::move(sourceErrors)) {}

    const std::vector<std::string>& sourceErrors() const { return sourceErrors_; }

private:
    std::vector<std::string> sourceErrors_;
};

// One usage sub-resource that failed while others succeeded. Recorded on
// the fetch result and logged; never thrown.
struct PartialFetchError {
    std::string source;
    std::string message;
};
