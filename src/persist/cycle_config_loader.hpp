#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "core/cycle_config.hpp"

namespace persist {

// Schema-specific parser for the cycle configuration. Unknown keys are rejected.
// The parsed config is validated before `out` is written.
bool parse_cycle_config(std::string_view json,
                        core::CycleConfig& out,
                        std::string& error) noexcept;

bool load_cycle_config(const std::filesystem::path& path,
                       core::CycleConfig& out,
                       std::string& error) noexcept;

} // namespace persist
