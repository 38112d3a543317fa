#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "api/alert_dispatcher.hpp"
#include "api/run_executor.hpp"
#include "api/run_preparer.hpp"
#include "core/cycle_clock.hpp"
#include "core/cycle_config.hpp"
#include "core/stage_error.hpp"
#include "core/state_resolver.hpp"
#include "ingest/nowcast_adapter.hpp"
#include "ingest/remote_archive.hpp"
#include "persist/archive_reconciler.hpp"
#include "persist/gap_filler.hpp"
#include "util/clock.hpp"

namespace api {

// External seams of one cycle. Null members get the production implementation.
struct CycleCollaborators {
    std::unique_ptr<ingest::IRemoteArchive> remote;
    std::unique_ptr<ingest::INowcastPredictor> predictor;
    std::unique_ptr<IMailTransport> mail;
};

enum class CycleStatus : std::uint8_t {
    Completed,  // engine was launched (whatever its exit status)
    Aborted     // policy stopped the cycle before the engine
};

struct CycleOutcome {
    CycleStatus status{CycleStatus::Aborted};
    core::CycleClock clock{};
    core::StageErrors errors;
    std::optional<core::Stage> abort_stage;
    persist::ReconcileCounters reconcile{};
    std::optional<persist::GapFillReport> gap_fill;
    std::uint64_t persisted_frames{0};
    std::optional<core::StateResolution> states;
    AlertStats alerts{};
    std::filesystem::path control_file;
    std::optional<RunOutcome> run;

    bool engine_ok() const noexcept { return run && run->ok(); }
};

// Reference instant for a cycle: the configured hindcast time when enabled, otherwise `clock`.
[[nodiscard]] util::TimePoint cycle_reference(const core::CycleConfig& cfg, const util::SystemClock& clock);

// One hourly forecast cycle: reconcile -> gap fill -> nowcast -> stage -> states/alerts ->
// prepare -> execute -> purge. Stages never throw; their errors are collected in the
// outcome and the configured policy decides whether the cycle goes on.
class ForecastCycle {
public:
    explicit ForecastCycle(core::CycleConfig cfg, CycleCollaborators deps = {});

    CycleOutcome run(util::TimePoint reference);

    const core::CycleConfig& config() const noexcept { return cfg_; }

private:
    // Appends `errors` to the outcome and applies the policy. True when the cycle must stop.
    bool absorb(CycleOutcome& out, core::Stage stage, const core::StageErrors& errors) const;
    // States, alerts, prepare and execute; runs while the ingestion folder is populated.
    void run_staged(CycleOutcome& out);
    void log_summary(const CycleOutcome& out) const;

    core::CycleConfig cfg_;
    persist::ArchiveReconciler reconciler_;
    persist::GapFiller gap_filler_;
    ingest::NowcastAdapter nowcast_;
    core::StateAvailabilityResolver resolver_;
    AlertDispatcher alerts_;
    RunPreparer preparer_;
    RunExecutor executor_;
};

} // namespace api
