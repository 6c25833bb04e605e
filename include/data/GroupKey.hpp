#pragma once
#include "Records.hpp"
#include <optional>
#include <string>

// Category key derivation. Every place that groups, filters, colors or
// labels records goes through these functions so bars, legend entries and
// filter menus always agree on the key for a record.

inline const std::string& unknownCategory() {
    static const std::string k = "unknown";
    return k;
}

inline std::string trimmed(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

// Trimmed value, or "unknown" when absent or blank
inline std::string trimmedOrUnknown(const std::optional<std::string>& field) {
    if (!field) return unknownCategory();
    auto t = trimmed(*field);
    return t.empty() ? unknownCategory() : t;
}

inline std::string groupKey(const CostRecord& r) {
    return trimmedOrUnknown(r.category);
}

inline std::string groupKey(const UsageRecord& r, GroupBy by) {
    switch (by) {
        case GroupBy::Model:   return trimmedOrUnknown(r.model);
        case GroupBy::ApiKeys: return trimmedOrUnknown(r.apiKeyId);
    }
    return unknownCategory();
}
