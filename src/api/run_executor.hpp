#pragma once

#include <filesystem>
#include <string>

#include "core/stage_error.hpp"
#include "util/process.hpp"

namespace api {

struct RunRequest {
    std::filesystem::path engine_path;
    std::filesystem::path work_dir;
    std::filesystem::path control_file;
    std::filesystem::path log_path;
};

struct RunOutcome {
    bool submitted{false};
    util::ProcessResult process{};

    bool ok() const noexcept { return submitted && process.ok(); }
};

// Engine log location inside the run's output directory.
[[nodiscard]] inline std::filesystem::path engine_log_path(const std::filesystem::path& output_dir) {
    return output_dir / "ef5.log";
}

// Launches `engine <controlFile>` on a single-slot worker and blocks until it exits.
class RunExecutor {
public:
    RunOutcome execute(const RunRequest& req);

    // Non-ok outcome as a RunFailure entry.
    static core::StageError to_error(const RunOutcome& outcome);
};

} // namespace api
