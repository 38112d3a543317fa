#include "api/run_executor.hpp"

#include "util/log.hpp"
#include "util/single_slot_worker.hpp"

namespace api {

RunOutcome RunExecutor::execute(const RunRequest& req) {
    RunOutcome outcome{};
    util::ProcessSpec spec;
    spec.argv = {req.engine_path.string(), req.control_file.string()};
    spec.work_dir = req.work_dir;
    spec.log_path = req.log_path;

    util::log(util::LogLevel::Info, "Launching %s %s (log %s)", req.engine_path.string().c_str(),
              req.control_file.string().c_str(), req.log_path.string().c_str());

    util::SingleSlotWorker worker;
    outcome.submitted = worker.submit([&outcome, &spec] { outcome.process = util::run_process(spec); });
    if (!outcome.submitted) {
        util::log(util::LogLevel::Error, "Engine worker busy, run not started");
        return outcome;
    }
    worker.join();

    if (outcome.process.ok()) {
        util::log(util::LogLevel::Info, "Engine finished successfully");
    } else {
        util::log(util::LogLevel::Error, "Engine run failed: %s", util::describe(outcome.process).c_str());
    }
    return outcome;
}

core::StageError RunExecutor::to_error(const RunOutcome& outcome) {
    const std::string detail = outcome.submitted ? util::describe(outcome.process) : "worker busy";
    return {core::Stage::Execute, core::StageErrorKind::RunFailure, detail};
}

} // namespace api
