#pragma once
#include <cstdint>
#include <string>

// Text helpers shared by the chart frame, the summary panel and print mode.

// 1234567 -> "1.2M", 45678 -> "45k", 999 -> "999"
std::string formatTokens(uint64_t tokens);

// "$12.35" with `decimals` fraction digits
std::string formatCurrency(double amount, int decimals = 2);

// Legend cost text: amounts >= $1 drop trailing zeros ("$12.5", "$3")
std::string formatLegendCost(double amount);

// Ids longer than 16 chars become "first8...last4"
std::string abbreviateApiKey(const std::string& id);

// Fits an "MM/DD" label into `width` columns: full label, then the day
// part, then a truncated day part
std::string compactDateLabel(const std::string& label, int width);
