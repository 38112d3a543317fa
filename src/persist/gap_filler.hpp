#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "core/cycle_clock.hpp"
#include "core/stage_error.hpp"
#include "ingest/remote_archive.hpp"
#include "persist/file_ops.hpp"

namespace persist {

using util::TimePoint;

enum class FillTier : std::uint8_t {
    UpToDate,    // newest observed frame already reaches the horizon
    FullSpan,    // archive had no observed frame at all
    SmallPatch,  // horizon - latest <= 60 min
    LargePatch   // extended outage
};

inline const char* tier_name(FillTier t) noexcept {
    switch (t) {
    case FillTier::UpToDate: return "up-to-date";
    case FillTier::FullSpan: return "full-span";
    case FillTier::SmallPatch: return "small-patch";
    case FillTier::LargePatch: return "large-patch";
    }
    return "unknown";
}

inline constexpr std::chrono::minutes kSmallPatchLimit{60};

struct GapFillReport {
    FillTier tier{FillTier::UpToDate};
    TimePoint span_start{};                       // first timestamp the archive must cover
    std::optional<ingest::TimeSpan> bulk_request; // absent when up to date
    std::vector<TimePoint> remote_filled;
    std::vector<TimePoint> store_filled;
    std::vector<TimePoint> unresolved;
    bool remote_unavailable{false};
    core::StageErrors errors;
};

// Completes the observed part of the working archive up to clock.horizon(), trying the
// remote archive in bulk, then per timestep, then the durable forecast store.
class GapFiller {
public:
    GapFiller(std::filesystem::path working,
              std::filesystem::path store,
              std::unique_ptr<ingest::IRemoteArchive> remote,
              std::unique_ptr<IFileOps> ops = nullptr);

    GapFillReport fill(const core::CycleClock& clock);

private:
    // First store file (by name) whose name carries the stamp of `ts`.
    std::optional<std::filesystem::path> find_in_store(TimePoint ts) const;

    std::filesystem::path working_;
    std::filesystem::path store_;
    std::unique_ptr<ingest::IRemoteArchive> remote_;
    std::unique_ptr<IFileOps> ops_;
};

} // namespace persist
