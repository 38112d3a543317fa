#include "ingest/remote_archive.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <system_error>
#include <utility>

#include "core/cycle_clock.hpp"
#include "core/precip_file.hpp"
#include "ingest/imerg_catalog.hpp"
#include "util/curl_easy.hpp"
#include "util/log.hpp"
#include "util/process.hpp"

namespace ingest {
namespace {

std::string format_coord(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6f", v);
    return buf;
}

bool covered(const std::filesystem::path& dest, TimePoint ts) {
    return core::is_non_zero_file(dest / core::precip_file_name(core::PrecipKind::Observed, ts)) ||
           core::is_non_zero_file(dest / core::precip_file_name(core::PrecipKind::Forecast, ts));
}

// Owns a staging directory for one download.
class StagingDir {
public:
    explicit StagingDir(std::filesystem::path p) : path_(std::move(p)) {}
    ~StagingDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            util::log(util::LogLevel::Warn, "Failed to remove staging dir %s: %s",
                      path_.string().c_str(), ec.message().c_str());
        }
    }
    StagingDir(const StagingDir&) = delete;
    StagingDir& operator=(const StagingDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace

CurlRemoteArchive::CurlRemoteArchive(RemoteArchiveOptions opts) : opts_(std::move(opts)) {
    if (opts_.staging_root.empty()) {
        std::error_code ec;
        opts_.staging_root = std::filesystem::temp_directory_path(ec);
        if (ec) {
            opts_.staging_root = "/tmp";
        }
    }
}

std::vector<std::string> CurlRemoteArchive::clip_command(const std::filesystem::path& in,
                                                         const std::filesystem::path& out) const {
    return {opts_.raster_tool,
            "-overwrite",
            "-te",
            format_coord(opts_.bbox.xmin),
            format_coord(opts_.bbox.ymin),
            format_coord(opts_.bbox.xmax),
            format_coord(opts_.bbox.ymax),
            in.string(),
            out.string()};
}

RemoteResult CurlRemoteArchive::fetch_range(const TimeSpan& span, const std::filesystem::path& dest) {
    std::size_t attempted = 0;
    std::size_t failed = 0;
    std::string last_error;
    for (const auto ts : core::cadence_grid(span.first, span.last)) {
        if (covered(dest, ts)) {
            continue;
        }
        ++attempted;
        const auto r = fetch_timestep(ts, dest);
        if (!r.ok) {
            ++failed;
            last_error = r.error;
        }
    }
    util::log(util::LogLevel::Info, "Bulk fetch %s .. %s: %zu attempted, %zu failed",
              util::human_stamp(span.first).c_str(), util::human_stamp(span.last).c_str(), attempted, failed);
    if (failed != 0) {
        return {false, std::to_string(failed) + " of " + std::to_string(attempted) +
                           " timesteps failed, last: " + last_error};
    }
    return {true, {}};
}

RemoteResult CurlRemoteArchive::list_timesteps(TimePoint ts, std::vector<TimePoint>& out) {
    const std::string url = imerg_listing_url(opts_.base_url, ts);
    std::string body;
    std::string err;
    if (!util::http_get_to_string(url, {opts_.credential, opts_.credential}, body, err)) {
        return {false, "listing " + err};
    }
    out.clear();
    for (const auto& href : scan_listing_hrefs(body)) {
        if (const auto t = imerg_observed_time(href)) {
            out.push_back(*t);
        }
    }
    std::sort(out.begin(), out.end());
    util::log(util::LogLevel::Debug, "Listing %s: %zu entries", url.c_str(), out.size());
    return {true, {}};
}

RemoteResult CurlRemoteArchive::fetch_timestep(TimePoint ts, const std::filesystem::path& dest) {
    const std::string stamp = util::stamp12(ts);
    StagingDir staging(opts_.staging_root /
                       ("hydrocast-" + std::to_string(::getpid()) + "-" + std::to_string(++staging_seq_)));
    std::error_code ec;
    std::filesystem::create_directories(staging.path(), ec);
    if (ec) {
        return {false, "staging " + staging.path().string() + ": " + ec.message()};
    }

    const auto raw = staging.path() / imerg_remote_name(ts);
    std::string err;
    util::log(util::LogLevel::Info, "Downloading %s", util::human_stamp(ts).c_str());
    if (!util::http_get_to_file(imerg_file_url(opts_.base_url, ts), {opts_.credential, opts_.credential}, raw, err)) {
        return {false, err};
    }

    const std::string final_name = core::precip_file_name(core::PrecipKind::Observed, ts);
    auto produced = raw;
    if (!opts_.raster_tool.empty()) {
        produced = staging.path() / final_name;
        util::ProcessSpec spec;
        spec.argv = clip_command(raw, produced);
        spec.log_path = staging.path() / "clip.log";
        const auto res = util::run_process(spec);
        if (!res.ok()) {
            return {false, "clip " + stamp + ": " + util::describe(res)};
        }
        if (!core::is_non_zero_file(produced)) {
            return {false, "clip " + stamp + ": no output written"};
        }
    }

    std::filesystem::create_directories(dest, ec);
    if (ec) {
        return {false, "mkdir " + dest.string() + ": " + ec.message()};
    }
    std::filesystem::copy_file(produced, dest / final_name,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return {false, "install " + final_name + ": " + ec.message()};
    }
    return {true, {}};
}

} // namespace ingest
