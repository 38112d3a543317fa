#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "util/time.hpp"

namespace core {

using util::TimePoint;

enum class PrecipKind : std::uint8_t {
    Observed,  // qpe
    Forecast   // qpf
};

struct PrecipFile {
    PrecipKind kind{PrecipKind::Observed};
    TimePoint timestamp{};
    std::filesystem::path path;
};

inline const char* kind_name(PrecipKind k) noexcept {
    return k == PrecipKind::Observed ? "qpe" : "qpf";
}

// imerg.<qpe|qpf>.<YYYYMMDDHHMM>.30minAccum.tif
[[nodiscard]] std::string precip_file_name(PrecipKind kind, TimePoint ts);

// Parses a canonical precip name on the 30-minute grid. Anything else (stray raw downloads,
// off-cadence stamps) yields nullopt.
[[nodiscard]] std::optional<PrecipFile> classify_precip(const std::filesystem::path& path);

// Forecast-named file -> observed name with the same timestamp; other names unchanged.
[[nodiscard]] std::string to_observed_name(std::string_view file_name);

// Regular files of `dir` that classify as precip. Unreadable directories set `error`.
bool scan_precip_dir(const std::filesystem::path& dir,
                     std::vector<PrecipFile>& out,
                     std::string& error);

// {variable}_{YYYYMMDD_HHMM}.tif
[[nodiscard]] std::string state_file_name(std::string_view variable, TimePoint ts);

// Exists, is a regular file and has a size above zero.
[[nodiscard]] bool is_non_zero_file(const std::filesystem::path& p) noexcept;

} // namespace core
