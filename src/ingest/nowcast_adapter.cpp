#include "ingest/nowcast_adapter.hpp"

#include <cstdio>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <utility>

#include "core/precip_file.hpp"
#include "util/log.hpp"
#include "util/process.hpp"

namespace ingest {

using core::PrecipFile;
using core::PrecipKind;

namespace {

std::string format_coord(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6f", v);
    return buf;
}

} // namespace

CommandNowcastPredictor::CommandNowcastPredictor(std::string command, std::filesystem::path log_path)
    : command_(std::move(command)), log_path_(std::move(log_path)) {}

std::vector<std::string> CommandNowcastPredictor::command_line(const PredictRequest& req) const {
    std::vector<std::string> argv;
    std::istringstream words(command_);
    std::string w;
    while (words >> w) {
        argv.push_back(w);
    }
    argv.insert(argv.end(), {"--model", req.model,
                             "--input", req.input_dir.string(),
                             "--output", req.output_dir.string(),
                             "--start", util::stamp12(req.start),
                             "--end", util::stamp12(req.end),
                             "--bbox", format_coord(req.bbox.xmin), format_coord(req.bbox.xmax),
                             format_coord(req.bbox.ymin), format_coord(req.bbox.ymax)});
    return argv;
}

PredictResult CommandNowcastPredictor::predict(const PredictRequest& req) {
    if (command_.find_first_not_of(" \t") == std::string::npos) {
        return {false, "no predictor command configured"};
    }
    util::ProcessSpec spec;
    spec.argv = command_line(req);
    spec.log_path = log_path_;
    const auto res = util::run_process(spec);
    if (!res.ok()) {
        return {false, "predictor " + util::describe(res)};
    }
    return {true, {}};
}

NowcastAdapter::NowcastAdapter(NowcastSettings settings,
                               std::filesystem::path precip_dir,
                               std::unique_ptr<INowcastPredictor> predictor,
                               std::unique_ptr<persist::IFileOps> ops)
    : settings_(std::move(settings)),
      precip_dir_(std::move(precip_dir)),
      predictor_(std::move(predictor)),
      ops_(std::move(ops)) {
    if (!ops_) {
        ops_ = std::make_unique<persist::PosixFileOps>();
    }
}

bool NowcastAdapter::frames_complete(TimePoint first, TimePoint last, std::string& missing) const {
    for (const auto ts : core::cadence_grid(first, last)) {
        if (!core::is_non_zero_file(precip_dir_ / core::precip_file_name(PrecipKind::Forecast, ts))) {
            missing = core::precip_file_name(PrecipKind::Forecast, ts);
            return false;
        }
    }
    return true;
}

NowcastReport NowcastAdapter::run(const core::CycleClock& clock, TimePoint span_start,
                                  std::size_t unresolved_gaps) {
    NowcastReport report{};
    const TimePoint first = clock.current;
    const TimePoint last = clock.nowcast_end();

    if (unresolved_gaps > settings_.max_unresolved_gaps) {
        report.predictor_skipped = true;
        util::log(util::LogLevel::Warn, "Skipping nowcast: %zu unresolved gaps exceed limit %zu",
                  unresolved_gaps, settings_.max_unresolved_gaps);
    } else if (!predictor_) {
        report.predictor_error = "no predictor";
    } else {
        util::log(util::LogLevel::Info, "Running %s nowcast %s .. %s", settings_.model.c_str(),
                  util::human_stamp(first).c_str(), util::human_stamp(last).c_str());
        PredictRequest req{settings_.model, precip_dir_, precip_dir_, first, last, settings_.bbox};
        const auto res = predictor_->predict(req);
        std::string missing;
        if (!res.ok) {
            report.predictor_error = res.error;
        } else if (!frames_complete(first, last, missing)) {
            report.predictor_error = "malformed output, missing " + missing;
        } else {
            report.predictor_ok = true;
        }
    }
    if (!report.predictor_ok && !report.predictor_skipped) {
        util::log(util::LogLevel::Warn, "Nowcast failed (%s), falling back to persistence",
                  report.predictor_error.c_str());
    }

    fill_by_persistence(span_start, last, report);
    return report;
}

void NowcastAdapter::fill_by_persistence(TimePoint first, TimePoint last, NowcastReport& report) {
    std::vector<PrecipFile> files;
    std::string err;
    if (!core::scan_precip_dir(precip_dir_, files, err)) {
        util::log(util::LogLevel::Error, "NowcastAdapter: %s", err.c_str());
        report.errors.push_back({core::Stage::Nowcast, core::StageErrorKind::PrepFailure, err});
        return;
    }

    std::set<TimePoint> covered;
    std::map<TimePoint, std::vector<std::filesystem::path>> empty;
    std::optional<PrecipFile> source;
    for (const auto& f : files) {
        if (!core::is_non_zero_file(f.path)) {
            empty[f.timestamp].push_back(f.path);
            continue;
        }
        covered.insert(f.timestamp);
        if (f.kind == PrecipKind::Observed && (!source || f.timestamp > source->timestamp)) {
            source = f;
        }
    }

    for (const auto ts : core::cadence_grid(first, last)) {
        if (covered.count(ts) != 0) {
            continue;
        }
        if (!source) {
            report.unresolved.push_back(ts);
            report.errors.push_back({core::Stage::Nowcast, core::StageErrorKind::TransientGap,
                                     "no observed frame to persist for " + util::stamp12(ts)});
            continue;
        }
        // A zero-byte frame at `ts` is replaced, never kept beside the persisted one.
        bool cleared = true;
        if (const auto it = empty.find(ts); it != empty.end()) {
            for (const auto& p : it->second) {
                const auto rm = ops_->remove(p);
                if (!rm.ok) {
                    const std::string detail = "remove " + p.string() + ": " + rm.error.message();
                    util::log(util::LogLevel::Warn, "NowcastAdapter: %s", detail.c_str());
                    report.errors.push_back({core::Stage::Nowcast, core::StageErrorKind::FileOpFailure, detail});
                    cleared = false;
                }
            }
        }
        if (!cleared) {
            report.unresolved.push_back(ts);
            continue;
        }
        const auto dest = precip_dir_ / core::precip_file_name(PrecipKind::Forecast, ts);
        const auto r = ops_->copy_overwrite(source->path, dest);
        if (!r.ok) {
            const std::string detail = "copy " + source->path.string() + " -> " + dest.string() + ": " +
                                       r.error.message();
            util::log(util::LogLevel::Warn, "NowcastAdapter: %s", detail.c_str());
            report.unresolved.push_back(ts);
            report.errors.push_back({core::Stage::Nowcast, core::StageErrorKind::FileOpFailure, detail});
            continue;
        }
        ++report.persisted;
    }
    if (report.persisted != 0) {
        util::log(util::LogLevel::Info, "Persisted %s into %llu frames",
                  source->path.filename().string().c_str(),
                  static_cast<unsigned long long>(report.persisted));
    }
    if (!report.unresolved.empty()) {
        util::log(util::LogLevel::Warn, "%zu timesteps without precipitation input", report.unresolved.size());
    }
}

} // namespace ingest
