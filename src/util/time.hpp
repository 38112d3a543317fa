#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace util {

// All cycle instants are UTC wall-clock points at minute resolution.
using TimePoint = std::chrono::system_clock::time_point;
using Minutes = std::chrono::minutes;

inline constexpr Minutes kCadence{30};

// Builds a UTC instant from calendar fields. Returns nullopt for out-of-range fields.
[[nodiscard]] std::optional<TimePoint> make_utc(int year, int month, int day, int hour, int minute) noexcept;

// strftime() over the UTC breakdown of `tp`.
[[nodiscard]] std::string format_utc(TimePoint tp, const char* fmt);

// "YYYYMMDDHHMM", used by precip file names and control file placeholders.
[[nodiscard]] inline std::string stamp12(TimePoint tp) { return format_utc(tp, "%Y%m%d%H%M"); }

// "YYYYMMDD_HHMM", used by state snapshot names and alert texts.
[[nodiscard]] inline std::string state_stamp(TimePoint tp) { return format_utc(tp, "%Y%m%d_%H%M"); }

// "YYYY-MM-DD HH:MM", used for log lines.
[[nodiscard]] inline std::string human_stamp(TimePoint tp) { return format_utc(tp, "%Y-%m-%d %H:%M"); }

// Parses exactly twelve digits "YYYYMMDDHHMM".
[[nodiscard]] std::optional<TimePoint> parse_stamp12(std::string_view s) noexcept;

// Parses "YYYY-MM-DD HH:MM" (hindcast override format).
[[nodiscard]] std::optional<TimePoint> parse_human_stamp(std::string_view s) noexcept;

[[nodiscard]] inline TimePoint floor_to_hour(TimePoint tp) noexcept {
    return std::chrono::floor<std::chrono::hours>(tp);
}

[[nodiscard]] inline bool on_cadence(TimePoint tp) noexcept {
    return std::chrono::floor<Minutes>(tp) == tp &&
           std::chrono::duration_cast<Minutes>(tp.time_since_epoch()).count() % kCadence.count() == 0;
}

} // namespace util
