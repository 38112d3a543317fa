#include "api/forecast_cycle.hpp"

#include <utility>

#include "util/log.hpp"

namespace api {
namespace {

std::unique_ptr<ingest::IRemoteArchive> default_remote(const core::CycleConfig& cfg,
                                                       std::unique_ptr<ingest::IRemoteArchive> remote) {
    if (remote) {
        return remote;
    }
    ingest::RemoteArchiveOptions opts;
    opts.base_url = cfg.remote.base_url;
    opts.credential = cfg.remote.credential;
    opts.raster_tool = cfg.remote.raster_tool;
    opts.bbox = cfg.bbox;
    return std::make_unique<ingest::CurlRemoteArchive>(std::move(opts));
}

std::unique_ptr<ingest::INowcastPredictor> default_predictor(const core::CycleConfig& cfg,
                                                             std::unique_ptr<ingest::INowcastPredictor> p) {
    if (p) {
        return p;
    }
    return std::make_unique<ingest::CommandNowcastPredictor>(cfg.nowcast.command);
}

} // namespace

util::TimePoint cycle_reference(const core::CycleConfig& cfg, const util::SystemClock& clock) {
    if (cfg.hindcast.enabled) {
        if (const auto t = util::parse_human_stamp(cfg.hindcast.timestamp)) {
            return *t;
        }
    }
    return clock.now();
}

ForecastCycle::ForecastCycle(core::CycleConfig cfg, CycleCollaborators deps)
    : cfg_(std::move(cfg)),
      reconciler_(persist::ArchivePaths{cfg_.paths.precip, cfg_.paths.store, cfg_.paths.ingest}),
      gap_filler_(cfg_.paths.precip, cfg_.paths.store, default_remote(cfg_, std::move(deps.remote))),
      nowcast_(ingest::NowcastSettings{cfg_.nowcast.model, cfg_.nowcast.max_unresolved_gaps, cfg_.bbox},
               cfg_.paths.precip,
               default_predictor(cfg_, std::move(deps.predictor))),
      resolver_(cfg_.paths.states, cfg_.state_variables),
      alerts_(cfg_.alerts, core::system_name(cfg_), std::move(deps.mail)) {}

bool ForecastCycle::absorb(CycleOutcome& out, core::Stage stage, const core::StageErrors& errors) const {
    out.errors.insert(out.errors.end(), errors.begin(), errors.end());
    if (core::decide(cfg_.policy, stage, errors) == core::Decision::Proceed) {
        return false;
    }
    out.status = CycleStatus::Aborted;
    out.abort_stage = stage;
    for (const auto& e : errors) {
        if (e.kind == core::StageErrorKind::PrepFailure) {
            util::log(util::LogLevel::Error, "Cycle aborted in %s stage: %s", core::stage_name(stage),
                      e.detail.c_str());
            break;
        }
    }
    return true;
}

CycleOutcome ForecastCycle::run(util::TimePoint reference) {
    CycleOutcome out{};
    out.clock = core::plan_cycle(reference);
    const auto& clock = out.clock;
    util::log(util::LogLevel::Info, "*** Starting %s run cycle at %s UTC ***",
              cfg_.hindcast.enabled ? "hindcast" : "real-time", util::human_stamp(clock.current).c_str());

    const auto rec = reconciler_.reconcile(clock);
    out.reconcile = rec.counters;
    if (absorb(out, core::Stage::Reconcile, rec.errors)) {
        return out;
    }

    auto gaps = gap_filler_.fill(clock);
    if (absorb(out, core::Stage::GapFill, gaps.errors)) {
        out.gap_fill = std::move(gaps);
        return out;
    }
    const auto span_start = gaps.span_start;
    const auto unresolved = gaps.unresolved.size();
    out.gap_fill = std::move(gaps);

    const auto nowcast = nowcast_.run(clock, span_start, unresolved);
    out.persisted_frames = nowcast.persisted;
    if (absorb(out, core::Stage::Nowcast, nowcast.errors)) {
        return out;
    }

    const auto staged = reconciler_.stage_for_ingestion();
    out.reconcile.staged = staged.counters.staged;
    out.reconcile.renamed = staged.counters.renamed;
    out.reconcile.file_failures += staged.counters.file_failures;
    if (!absorb(out, core::Stage::Reconcile, staged.errors)) {
        run_staged(out);
    }

    // The ingestion folder is emptied whether or not the engine ran.
    const auto purged = reconciler_.purge_ingestion();
    out.reconcile.purged = purged.counters.purged;
    out.reconcile.file_failures += purged.counters.file_failures;
    out.errors.insert(out.errors.end(), purged.errors.begin(), purged.errors.end());

    log_summary(out);
    return out;
}

void ForecastCycle::run_staged(CycleOutcome& out) {
    const auto& clock = out.clock;
    auto states = resolver_.resolve(clock);
    if (states.start_class == core::StartClass::Cold) {
        core::StageErrors missing{{core::Stage::States, core::StageErrorKind::MissingState,
                                   "no complete state set after " + util::human_stamp(clock.fail_time)}};
        if (absorb(out, core::Stage::States, missing)) {
            return;
        }
    }
    out.alerts = alerts_.dispatch(clock, states);

    const auto fields = control_fields_for(clock, states.resolved_start, cfg_.paths.output,
                                           cfg_.paths.states, cfg_.system_model);
    out.states = std::move(states);
    PrepareRequest prep{cfg_.paths.control_template, cfg_.paths.output, cfg_.paths.data,
                        core::control_file_name(cfg_), fields};
    const auto prepared = preparer_.prepare(prep);
    if (absorb(out, core::Stage::Prepare, prepared.errors) || !prepared.ok) {
        out.status = CycleStatus::Aborted;
        out.abort_stage = core::Stage::Prepare;
        return;
    }
    out.control_file = prepared.control_file;

    RunRequest req{cfg_.paths.engine, cfg_.paths.engine_work_dir, prepared.control_file,
                   engine_log_path(cfg_.paths.output)};
    out.run = executor_.execute(req);
    out.status = CycleStatus::Completed;
    if (!out.run->ok()) {
        out.errors.push_back(RunExecutor::to_error(*out.run));
    }
}

void ForecastCycle::log_summary(const CycleOutcome& out) const {
    const auto& c = out.clock;
    const char* start_class = out.states ? core::start_class_name(out.states->start_class) : "n/a";
    const std::string begin = out.states ? util::human_stamp(out.states->resolved_start) : "n/a";
    util::log(util::LogLevel::Info,
              "Cycle %s: start %s (%s), state update ends %s, simulation ends %s, engine %s, %zu stage errors",
              util::state_stamp(c.current).c_str(), begin.c_str(), start_class,
              util::human_stamp(c.system_state_end).c_str(), util::human_stamp(c.system_end).c_str(),
              out.run ? util::describe(out.run->process).c_str() : "not run", out.errors.size());
}

} // namespace api
