#pragma once

#include <string>
#include <vector>

#include "api/forecast_cycle.hpp"

namespace cycle_cli {

constexpr int kExitSuccess = 0;
constexpr int kExitUsage = 2;
constexpr int kExitConfigError = 3;
constexpr int kExitAborted = 4;
constexpr int kExitEngineFailure = 5;

// Run using argv-style inputs.
int run_cycle_main(int argc, char** argv);

// Convenience for tests / programmatic callers. `deps` replaces the production seams.
int run_cycle_cli(const std::vector<std::string>& args, api::CycleCollaborators deps = {});

} // namespace cycle_cli
