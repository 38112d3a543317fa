#include "api/cycle_cli.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "persist/cycle_config_loader.hpp"
#include "util/clock.hpp"
#include "util/curl_easy.hpp"
#include "util/log.hpp"

namespace cycle_cli {
namespace {

struct CliOptions {
    std::filesystem::path config_path;
    std::optional<std::string> hindcast;
    std::optional<std::string> log_file;
    bool verbose{false};
    bool quiet{false};
    bool strict_exit{false};
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --config <path> [options]\n"
              << "Options:\n"
              << "  --hindcast \"YYYY-MM-DD HH:MM\"  Run the cycle for a past UTC time\n"
              << "  --log-file <path>              Mirror log records into <path>\n"
              << "  --verbose                      Debug logging\n"
              << "  --quiet                        Warnings and errors only\n"
              << "  --strict-exit                  Exit non-zero when the engine run fails\n";
}

bool parse_cli(int argc, char** argv, CliOptions& out) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--hindcast" && i + 1 < argc) {
            opts.hindcast = std::string(argv[++i]);
        } else if (arg == "--log-file" && i + 1 < argc) {
            opts.log_file = std::string(argv[++i]);
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "--strict-exit") {
            opts.strict_exit = true;
        } else {
            print_usage(argv[0]);
            return false;
        }
    }
    if (opts.config_path.empty() || (opts.verbose && opts.quiet)) {
        print_usage(argv[0]);
        return false;
    }
    out = std::move(opts);
    return true;
}

std::string format_error(int code, std::string_view description, std::string_view details, std::string_view action) {
    std::ostringstream oss;
    oss << "Exit " << code << ": " << description << "\n"
        << "Details: " << details << "\n"
        << "Action: " << action;
    return oss.str();
}

int run_cycle(const CliOptions& cli, api::CycleCollaborators deps) {
    core::CycleConfig cfg;
    std::string err;
    if (!persist::load_cycle_config(cli.config_path, cfg, err)) {
        std::cerr << format_error(kExitConfigError,
                                  "Invalid configuration",
                                  err,
                                  "Fix the config file and retry") << std::endl;
        return kExitConfigError;
    }
    if (cli.hindcast) {
        if (!util::parse_human_stamp(*cli.hindcast)) {
            std::cerr << format_error(kExitUsage,
                                      "Invalid hindcast time",
                                      "\"" + *cli.hindcast + "\" is not \"YYYY-MM-DD HH:MM\"",
                                      "Pass a UTC time such as \"2024-07-04 09:00\"") << std::endl;
            return kExitUsage;
        }
        cfg.hindcast.enabled = true;
        cfg.hindcast.timestamp = *cli.hindcast;
    }

    util::LogLevel level = util::LogLevel::Info;
    if (!cfg.log.level.empty() && !util::level_from_string(cfg.log.level, level)) {
        std::cerr << format_error(kExitConfigError,
                                  "Invalid log level",
                                  "log.level \"" + cfg.log.level + "\" is not a known level",
                                  "Use trace, debug, info, warn, error or fatal") << std::endl;
        return kExitConfigError;
    }
    if (cli.verbose) {
        level = util::LogLevel::Debug;
    } else if (cli.quiet) {
        level = util::LogLevel::Warn;
    }
    util::set_min_level(level);

    const std::string mirror = cli.log_file ? *cli.log_file : cfg.log.file;
    if (!mirror.empty() && !util::set_mirror_file(mirror)) {
        std::cerr << format_error(kExitConfigError,
                                  "Cannot open log file",
                                  mirror,
                                  "Check the path and permissions") << std::endl;
        return kExitConfigError;
    }

    util::CurlGlobal curl;
    if (!curl.ok()) {
        util::log(util::LogLevel::Warn, "libcurl global init failed, remote transfers will fail");
    }

    const util::SystemClock wall_clock{};
    api::ForecastCycle cycle(cfg, std::move(deps));
    const auto outcome = cycle.run(api::cycle_reference(cycle.config(), wall_clock));

    int code = kExitSuccess;
    if (outcome.status == api::CycleStatus::Aborted) {
        const std::string stage = outcome.abort_stage ? core::stage_name(*outcome.abort_stage) : "unknown";
        std::string detail = "stage " + stage;
        for (const auto& e : outcome.errors) {
            if (e.kind == core::StageErrorKind::PrepFailure) {
                detail += ": " + e.detail;
                break;
            }
        }
        std::cerr << format_error(kExitAborted,
                                  "Cycle aborted",
                                  detail,
                                  "Check folder permissions and the control template, then rerun") << std::endl;
        code = kExitAborted;
    } else if (!outcome.engine_ok() && cli.strict_exit) {
        std::cerr << format_error(kExitEngineFailure,
                                  "Engine run failed",
                                  util::describe(outcome.run->process),
                                  "Inspect " + api::engine_log_path(cfg.paths.output).string()) << std::endl;
        code = kExitEngineFailure;
    }
    if (!util::set_mirror_file("")) {
        std::cerr << "Failed to close log file" << std::endl;
    }
    return code;
}

} // namespace

int run_cycle_cli(const std::vector<std::string>& args, api::CycleCollaborators deps) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(const_cast<char*>("hydrocast_cycle"));
    for (const auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    CliOptions cli;
    if (!parse_cli(static_cast<int>(argv.size()), argv.data(), cli)) {
        return kExitUsage;
    }
    return run_cycle(cli, std::move(deps));
}

int run_cycle_main(int argc, char** argv) {
    CliOptions cli;
    if (!parse_cli(argc, argv, cli)) {
        return kExitUsage;
    }
    return run_cycle(cli, {});
}

} // namespace cycle_cli
