#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "util/time.hpp"

namespace ingest {

using util::TimePoint;

// Early-run half-hourly GIS product, as published on the remote archive.
inline constexpr std::string_view kImergPrefix = "3B-HHR-E.MS.MRG.3IMERG.";
inline constexpr std::string_view kImergSuffix = ".V07B.30min.tif";
inline constexpr std::string_view kListingSuffix = "30min.tif";

// Remote file holding the accumulation that ends at `observed_ts`:
// 3B-HHR-E.MS.MRG.3IMERG.YYYYMMDD-SHHMMSS-EHHMM59.MMMM.V07B.30min.tif
// where S = observed_ts - 30min, E = S + 29min and MMMM = minutes of S since midnight.
[[nodiscard]] std::string imerg_remote_name(TimePoint observed_ts);

// "YYYY/MM/" of the accumulation start.
[[nodiscard]] std::string imerg_month_folder(TimePoint observed_ts);

[[nodiscard]] std::string imerg_listing_url(std::string_view base_url, TimePoint observed_ts);
[[nodiscard]] std::string imerg_file_url(std::string_view base_url, TimePoint observed_ts);

// Observed timestamp (accumulation start + 30min) of a remote name. Leading path
// components are ignored; names that are not IMERG half-hourly products yield nullopt.
[[nodiscard]] std::optional<TimePoint> imerg_observed_time(std::string_view remote_name);

// Every href target of an HTML directory listing that ends in "30min.tif".
[[nodiscard]] std::vector<std::string> scan_listing_hrefs(std::string_view html);

} // namespace ingest
