#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/cycle_config.hpp"
#include "util/time.hpp"

namespace ingest {

using util::TimePoint;

struct RemoteResult {
    bool ok{false};
    std::string error;
};

// Inclusive range of observed timestamps on the 30-minute grid.
struct TimeSpan {
    TimePoint first{};
    TimePoint last{};

    bool operator==(const TimeSpan&) const = default;
};

// Source of observed precipitation frames. Every frame lands in `dest` under its
// canonical observed name, clipped to the domain.
class IRemoteArchive {
public:
    virtual ~IRemoteArchive() = default;

    // Fetches every timestep of `span` that `dest` does not already cover.
    virtual RemoteResult fetch_range(const TimeSpan& span, const std::filesystem::path& dest) = 0;

    // Observed timestamps currently published in the listing that would hold `ts`.
    virtual RemoteResult list_timesteps(TimePoint ts, std::vector<TimePoint>& out) = 0;

    virtual RemoteResult fetch_timestep(TimePoint ts, const std::filesystem::path& dest) = 0;
};

struct RemoteArchiveOptions {
    std::string base_url;
    std::string credential;                 // basic auth user and password
    std::string raster_tool{"gdalwarp"};    // empty: raw download is kept as-is
    core::BoundingBox bbox{};
    std::filesystem::path staging_root{};   // default: system temp directory
};

// HTTPS archive with YYYY/MM/ directory listings. Downloads are staged in a private
// temporary directory which is removed whatever the outcome.
class CurlRemoteArchive : public IRemoteArchive {
public:
    explicit CurlRemoteArchive(RemoteArchiveOptions opts);

    RemoteResult fetch_range(const TimeSpan& span, const std::filesystem::path& dest) override;
    RemoteResult list_timesteps(TimePoint ts, std::vector<TimePoint>& out) override;
    RemoteResult fetch_timestep(TimePoint ts, const std::filesystem::path& dest) override;

    const RemoteArchiveOptions& options() const noexcept { return opts_; }

    // Raster tool argv clipping `in` to the bounding box into `out`.
    std::vector<std::string> clip_command(const std::filesystem::path& in,
                                          const std::filesystem::path& out) const;

private:
    RemoteArchiveOptions opts_;
    std::uint64_t staging_seq_{0};
};

} // namespace ingest
