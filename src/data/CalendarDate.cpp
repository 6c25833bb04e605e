#include "data/CalendarDate.hpp"
#include <cctype>
#include <cstdio>

CalendarDate CalendarDate::fromYmd(int year, unsigned month, unsigned day) {
    int y = year - (month <= 2 ? 1 : 0);
    int64_t era = (y >= 0 ? y : y - 399) / 400;
    unsigned yoe = static_cast<unsigned>(y - era * 400);
    unsigned mp  = month > 2 ? month - 3 : month + 9;
    unsigned doy = (153 * mp + 2) / 5 + day - 1;
    unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return CalendarDate(era * 146097 + static_cast<int64_t>(doe) - 719468);
}

CalendarDate CalendarDate::fromUnixSeconds(int64_t seconds) {
    int64_t days = seconds / 86400;
    if (seconds % 86400 < 0) days--;   // floor for pre-epoch values
    return CalendarDate(days);
}

std::optional<CalendarDate> CalendarDate::parseIso(const std::string& text) {
    if (text.size() < 10 || text[4] != '-' || text[7] != '-')
        return std::nullopt;

    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!std::isdigit(static_cast<unsigned char>(text[i])))
            return std::nullopt;
    }

    int year       = std::stoi(text.substr(0, 4));
    unsigned month = static_cast<unsigned>(std::stoi(text.substr(5, 2)));
    unsigned day   = static_cast<unsigned>(std::stoi(text.substr(8, 2)));
    if (month < 1 || month > 12 || day < 1 || day > 31)
        return std::nullopt;

    return fromYmd(year, month, day);
}

CalendarDate CalendarDate::today() {
    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();
    return fromUnixSeconds(secs);
}

CalendarDate::Civil CalendarDate::civil() const {
    int64_t z = days_ + 719468;
    int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    unsigned doe = static_cast<unsigned>(z - era * 146097);
    unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t y = static_cast<int64_t>(yoe) + era * 400;
    unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    unsigned mp = (5 * doy + 2) / 153;
    unsigned d = doy - (153 * mp + 2) / 5 + 1;
    unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return {static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d};
}

int CalendarDate::year() const { return civil().year; }
unsigned CalendarDate::month() const { return civil().month; }
unsigned CalendarDate::day() const { return civil().day; }

std::string CalendarDate::isoDate() const {
    auto c = civil();
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", c.year, c.month, c.day);
    return buf;
}

std::string CalendarDate::isoTimestamp() const {
    return isoDate() + "T00:00:00Z";
}

std::string CalendarDate::shortLabel() const {
    auto c = civil();
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02u/%02u", c.month, c.day);
    return buf;
}
