#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Lenient field readers for vendor payloads: absent and null fields fall
// back instead of throwing, wrong types still throw json::type_error.

inline std::optional<std::string> optionalString(const nlohmann::json& j,
                                                 const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

inline uint64_t tokenCount(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return 0;
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    if (it->is_number_integer()) {
        auto v = it->get<int64_t>();
        return v > 0 ? static_cast<uint64_t>(v) : 0;
    }
    if (it->is_number_float()) {
        auto v = it->get<double>();
        return v > 0 ? static_cast<uint64_t>(v) : 0;
    }
    return it->get<uint64_t>();   // throws type_error for non-numbers
}

inline std::optional<uint64_t> optionalCount(const nlohmann::json& j,
                                             const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return tokenCount(j, key);
}
