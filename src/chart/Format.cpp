#include "chart/Format.hpp"
#include <iomanip>
#include <sstream>

std::string formatTokens(uint64_t tokens) {
    if (tokens >= 1000000) {
        std::ostringstream out;
        out << std::fixed << std::setprecision(1)
            << static_cast<double>(tokens) / 1000000.0 << "M";
        return out.str();
    }
    if (tokens >= 1000)
        return std::to_string(tokens / 1000) + "k";
    return std::to_string(tokens);
}

std::string formatCurrency(double amount, int decimals) {
    std::ostringstream out;
    out << "$" << std::fixed << std::setprecision(decimals) << amount;
    return out.str();
}

std::string formatLegendCost(double amount) {
    std::string s = formatCurrency(amount, 2);
    if (amount < 1.0) return s;

    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    return s;
}

std::string abbreviateApiKey(const std::string& id) {
    if (id.size() <= 16) return id;
    return id.substr(0, 8) + "..." + id.substr(id.size() - 4);
}

std::string compactDateLabel(const std::string& label, int width) {
    if (width <= 0) return {};
    if (static_cast<size_t>(width) >= label.size()) return label;

    auto slash = label.find('/');
    std::string day = slash == std::string::npos ? label : label.substr(slash + 1);
    if (static_cast<size_t>(width) >= day.size()) return day;

    return day.substr(0, static_cast<size_t>(width));
}
