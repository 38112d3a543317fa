#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace util {

struct ProcessResult {
    bool launched{false};
    int exit_code{-1};
    int term_signal{0};
    std::string error;

    bool ok() const noexcept { return launched && term_signal == 0 && exit_code == 0; }
};

struct ProcessSpec {
    std::vector<std::string> argv;      // argv[0] is resolved through PATH
    std::filesystem::path work_dir{};   // child chdir()s here when non-empty
    std::filesystem::path log_path{};   // stdout+stderr truncate-redirected here when non-empty
};

// fork()/execvp() the command and block until it exits. Never throws.
ProcessResult run_process(const ProcessSpec& spec) noexcept;

// Human readable "exit=N" / "signal=N" / "launch failed: ..." summary.
std::string describe(const ProcessResult& res);

} // namespace util
