#include "persist/gap_filler.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <utility>

#include "core/precip_file.hpp"
#include "util/log.hpp"

namespace persist {

using core::PrecipFile;
using core::PrecipKind;

namespace {

bool scan_working(const std::filesystem::path& dir, std::set<TimePoint>& covered,
                  std::optional<TimePoint>& latest_observed, std::string& error) {
    std::vector<PrecipFile> files;
    if (!core::scan_precip_dir(dir, files, error)) {
        return false;
    }
    covered.clear();
    latest_observed.reset();
    for (const auto& f : files) {
        covered.insert(f.timestamp);
        if (f.kind == PrecipKind::Observed && (!latest_observed || f.timestamp > *latest_observed)) {
            latest_observed = f.timestamp;
        }
    }
    return true;
}

} // namespace

GapFiller::GapFiller(std::filesystem::path working,
                     std::filesystem::path store,
                     std::unique_ptr<ingest::IRemoteArchive> remote,
                     std::unique_ptr<IFileOps> ops)
    : working_(std::move(working)),
      store_(std::move(store)),
      remote_(std::move(remote)),
      ops_(std::move(ops)) {
    if (!ops_) {
        ops_ = std::make_unique<PosixFileOps>();
    }
}

std::optional<std::filesystem::path> GapFiller::find_in_store(TimePoint ts) const {
    const std::string stamp = util::stamp12(ts);
    std::error_code ec;
    std::filesystem::directory_iterator it(store_, ec);
    if (ec) {
        util::log(util::LogLevel::Debug, "Store %s not readable: %s", store_.string().c_str(),
                  ec.message().c_str());
        return std::nullopt;
    }
    std::vector<std::filesystem::path> matches;
    for (const auto end = std::filesystem::directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        if (it->path().filename().string().find(stamp) != std::string::npos) {
            matches.push_back(it->path());
        }
    }
    if (matches.empty()) {
        return std::nullopt;
    }
    return *std::min_element(matches.begin(), matches.end());
}

GapFillReport GapFiller::fill(const core::CycleClock& clock) {
    GapFillReport report{};
    const TimePoint horizon = clock.horizon();
    report.span_start = clock.bulk_span_start();

    std::set<TimePoint> covered;
    std::optional<TimePoint> latest;
    std::string err;
    if (!scan_working(working_, covered, latest, err)) {
        util::log(util::LogLevel::Error, "GapFiller: %s", err.c_str());
        report.errors.push_back({core::Stage::GapFill, core::StageErrorKind::PrepFailure, err});
        return report;
    }

    if (!latest) {
        report.tier = FillTier::FullSpan;
        report.span_start = clock.bulk_span_start();
        util::log(util::LogLevel::Info, "No observed precipitation on disk, fetching %s .. %s",
                  util::human_stamp(report.span_start).c_str(), util::human_stamp(horizon).c_str());
    } else if (*latest >= horizon) {
        report.tier = FillTier::UpToDate;
        report.span_start = *latest;
        util::log(util::LogLevel::Info, "Observed precipitation up to date (%s)",
                  util::human_stamp(*latest).c_str());
    } else if (horizon - *latest <= kSmallPatchLimit) {
        report.tier = FillTier::SmallPatch;
        report.span_start = *latest;
        util::log(util::LogLevel::Info, "Patching observed precipitation %s .. %s",
                  util::human_stamp(*latest).c_str(), util::human_stamp(horizon).c_str());
    } else {
        report.tier = FillTier::LargePatch;
        report.span_start = *latest;
        util::log(util::LogLevel::Warn, "Extended outage: observed precipitation ends at %s, fetching up to %s",
                  util::human_stamp(*latest).c_str(), util::human_stamp(horizon).c_str());
    }

    if (report.tier != FillTier::UpToDate) {
        report.bulk_request = ingest::TimeSpan{report.span_start, horizon};
        if (remote_) {
            const auto r = remote_->fetch_range(*report.bulk_request, working_);
            if (!r.ok) {
                util::log(util::LogLevel::Warn, "Bulk download incomplete: %s", r.error.c_str());
                report.errors.push_back({core::Stage::GapFill, core::StageErrorKind::RemoteUnavailable, r.error});
            }
        }
        if (!scan_working(working_, covered, latest, err)) {
            util::log(util::LogLevel::Error, "GapFiller: %s", err.c_str());
            report.errors.push_back({core::Stage::GapFill, core::StageErrorKind::PrepFailure, err});
            return report;
        }
    }

    report.remote_unavailable = !remote_;
    for (const auto ts : core::cadence_grid(report.span_start, horizon)) {
        if (covered.count(ts) != 0) {
            continue;
        }

        bool filled = false;
        if (!report.remote_unavailable) {
            std::vector<TimePoint> listed;
            const auto lr = remote_->list_timesteps(ts, listed);
            if (!lr.ok) {
                report.remote_unavailable = true;
                util::log(util::LogLevel::Warn, "Remote archive unavailable, using the store only: %s",
                          lr.error.c_str());
                report.errors.push_back({core::Stage::GapFill, core::StageErrorKind::RemoteUnavailable, lr.error});
            } else if (std::find(listed.begin(), listed.end(), ts) != listed.end()) {
                const auto fr = remote_->fetch_timestep(ts, working_);
                if (fr.ok && core::is_non_zero_file(working_ / core::precip_file_name(PrecipKind::Observed, ts))) {
                    report.remote_filled.push_back(ts);
                    filled = true;
                } else if (!fr.ok) {
                    util::log(util::LogLevel::Warn, "Download of %s failed: %s",
                              util::human_stamp(ts).c_str(), fr.error.c_str());
                }
            }
        }

        if (!filled) {
            if (const auto stored = find_in_store(ts)) {
                const auto r = ops_->copy_overwrite(*stored, working_ / stored->filename());
                if (r.ok) {
                    util::log(util::LogLevel::Info, "Filled %s from store (%s)", util::human_stamp(ts).c_str(),
                              stored->filename().string().c_str());
                    report.store_filled.push_back(ts);
                    filled = true;
                } else {
                    const std::string detail = "copy " + stored->string() + ": " + r.error.message();
                    util::log(util::LogLevel::Warn, "GapFiller: %s", detail.c_str());
                    report.errors.push_back({core::Stage::GapFill, core::StageErrorKind::FileOpFailure, detail});
                }
            }
        }

        if (filled) {
            covered.insert(ts);
            continue;
        }
        util::log(util::LogLevel::Warn, "Unresolved precipitation gap at %s", util::human_stamp(ts).c_str());
        report.unresolved.push_back(ts);
        report.errors.push_back({core::Stage::GapFill, core::StageErrorKind::TransientGap, util::stamp12(ts)});
    }

    util::log(util::LogLevel::Info, "Gap fill (%s): remote=%zu store=%zu unresolved=%zu", tier_name(report.tier),
              report.remote_filled.size(), report.store_filled.size(), report.unresolved.size());
    return report;
}

} // namespace persist
