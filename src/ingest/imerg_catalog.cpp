#include "ingest/imerg_catalog.hpp"

#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdio>

namespace ingest {
namespace {

std::string join_url(std::string_view base, std::string_view rest) {
    std::string out(base);
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    out.push_back('/');
    out.append(rest);
    return out;
}

bool parse_digits(std::string_view s, std::size_t pos, std::size_t len, int& out) noexcept {
    if (pos + len > s.size()) {
        return false;
    }
    for (std::size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    const auto res = std::from_chars(s.data() + pos, s.data() + pos + len, out);
    return res.ec == std::errc();
}

bool ends_with(std::string_view s, std::string_view suffix) noexcept {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

} // namespace

std::string imerg_remote_name(TimePoint observed_ts) {
    const TimePoint start = observed_ts - util::kCadence;
    const TimePoint end = start + std::chrono::minutes{29};
    const auto since_midnight =
        std::chrono::duration_cast<std::chrono::minutes>(start - std::chrono::floor<std::chrono::days>(start));

    char minutes[8];
    std::snprintf(minutes, sizeof(minutes), "%04d", static_cast<int>(since_midnight.count()));

    std::string name(kImergPrefix);
    name += util::format_utc(start, "%Y%m%d-S%H%M%S");
    name += util::format_utc(end, "-E%H%M59");
    name += '.';
    name += minutes;
    name += kImergSuffix;
    return name;
}

std::string imerg_month_folder(TimePoint observed_ts) {
    return util::format_utc(observed_ts - util::kCadence, "%Y/%m/");
}

std::string imerg_listing_url(std::string_view base_url, TimePoint observed_ts) {
    return join_url(base_url, imerg_month_folder(observed_ts));
}

std::string imerg_file_url(std::string_view base_url, TimePoint observed_ts) {
    return join_url(base_url, imerg_month_folder(observed_ts) + imerg_remote_name(observed_ts));
}

std::optional<TimePoint> imerg_observed_time(std::string_view remote_name) {
    const auto slash = remote_name.rfind('/');
    if (slash != std::string_view::npos) {
        remote_name.remove_prefix(slash + 1);
    }
    if (remote_name.substr(0, kImergPrefix.size()) != kImergPrefix || !ends_with(remote_name, kListingSuffix)) {
        return std::nullopt;
    }
    // YYYYMMDD-SHHMMSS
    const std::string_view stamp = remote_name.substr(kImergPrefix.size());
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!parse_digits(stamp, 0, 4, y) || !parse_digits(stamp, 4, 2, mo) || !parse_digits(stamp, 6, 2, d)) {
        return std::nullopt;
    }
    if (stamp.size() < 16 || stamp[8] != '-' || stamp[9] != 'S') {
        return std::nullopt;
    }
    if (!parse_digits(stamp, 10, 2, h) || !parse_digits(stamp, 12, 2, mi) || !parse_digits(stamp, 14, 2, s)) {
        return std::nullopt;
    }
    const auto start = util::make_utc(y, mo, d, h, mi);
    if (!start || s != 0) {
        return std::nullopt;
    }
    return *start + util::kCadence;
}

std::vector<std::string> scan_listing_hrefs(std::string_view html) {
    std::vector<std::string> out;
    constexpr std::string_view kHref = "href=";
    std::size_t pos = 0;
    while ((pos = html.find(kHref, pos)) != std::string_view::npos) {
        pos += kHref.size();
        if (pos >= html.size()) {
            break;
        }
        const char quote = html[pos];
        if (quote != '"' && quote != '\'') {
            continue;
        }
        const auto close = html.find(quote, pos + 1);
        if (close == std::string_view::npos) {
            break;
        }
        const std::string_view target = html.substr(pos + 1, close - pos - 1);
        if (ends_with(target, kListingSuffix)) {
            out.emplace_back(target);
        }
        pos = close + 1;
    }
    return out;
}

} // namespace ingest
