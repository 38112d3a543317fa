#include "util/time.hpp"

#include <charconv>
#include <ctime>

namespace util {
namespace {

bool parse_fixed(std::string_view s, std::size_t pos, std::size_t len, int& out) noexcept {
    if (pos + len > s.size()) {
        return false;
    }
    for (std::size_t i = pos; i < pos + len; ++i) {
        if (s[i] < '0' || s[i] > '9') {
            return false;
        }
    }
    const auto res = std::from_chars(s.data() + pos, s.data() + pos + len, out);
    return res.ec == std::errc();
}

int days_in_month(int year, int month) noexcept {
    static constexpr int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return days[month - 1];
}

} // namespace

std::optional<TimePoint> make_utc(int year, int month, int day, int hour, int minute) noexcept {
    if (year < 1970 || month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) ||
        hour < 0 || hour > 23 || minute < 0 || minute > 59) {
        return std::nullopt;
    }
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = 0;
#if defined(_WIN32)
    const std::time_t t = _mkgmtime(&tm);
#else
    const std::time_t t = timegm(&tm);
#endif
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

std::string format_utc(TimePoint tp, const char* fmt) {
    const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::floor<std::chrono::seconds>(tp));
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[64];
    const std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

std::optional<TimePoint> parse_stamp12(std::string_view s) noexcept {
    if (s.size() != 12) {
        return std::nullopt;
    }
    int y = 0, mo = 0, d = 0, h = 0, mi = 0;
    if (!parse_fixed(s, 0, 4, y) || !parse_fixed(s, 4, 2, mo) || !parse_fixed(s, 6, 2, d) ||
        !parse_fixed(s, 8, 2, h) || !parse_fixed(s, 10, 2, mi)) {
        return std::nullopt;
    }
    return make_utc(y, mo, d, h, mi);
}

std::optional<TimePoint> parse_human_stamp(std::string_view s) noexcept {
    // YYYY-MM-DD HH:MM
    if (s.size() != 16 || s[4] != '-' || s[7] != '-' || (s[10] != ' ' && s[10] != 'T') || s[13] != ':') {
        return std::nullopt;
    }
    int y = 0, mo = 0, d = 0, h = 0, mi = 0;
    if (!parse_fixed(s, 0, 4, y) || !parse_fixed(s, 5, 2, mo) || !parse_fixed(s, 8, 2, d) ||
        !parse_fixed(s, 11, 2, h) || !parse_fixed(s, 14, 2, mi)) {
        return std::nullopt;
    }
    return make_utc(y, mo, d, h, mi);
}

} // namespace util
