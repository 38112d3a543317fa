#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/cycle_clock.hpp"
#include "core/stage_error.hpp"

namespace api {

// Token (without braces) -> replacement.
using FieldTable = std::vector<std::pair<std::string, std::string>>;

// Replaces every "{TOKEN}" found in `fields`. Unknown tokens and unterminated braces
// are copied through verbatim.
[[nodiscard]] std::string render_template(std::string_view text, const FieldTable& fields);

struct ControlFields {
    std::filesystem::path output_path;
    std::filesystem::path states_path;
    util::TimePoint resolved_start{};
    util::TimePoint forecast_start{};
    util::TimePoint warm_end{};
    util::TimePoint state_end{};
    util::TimePoint end{};
    std::string model_name;
};

// Field table for the engine control file: OUTPUTPATH STATESPATH TIMEBEGIN TIMEBEGINLR
// TIMEWARMEND TIMESTATE TIMEEND SYSTEMMODEL.
[[nodiscard]] FieldTable control_field_table(const ControlFields& f);

[[nodiscard]] ControlFields control_fields_for(const core::CycleClock& clock,
                                               util::TimePoint resolved_start,
                                               const std::filesystem::path& output_path,
                                               const std::filesystem::path& states_path,
                                               const std::string& model_name);

struct PrepareResult {
    bool ok{false};
    std::filesystem::path control_file;
    core::StageErrors errors;
};

struct PrepareRequest {
    std::filesystem::path template_path;
    std::filesystem::path output_dir;   // recreated, receives the control file
    std::filesystem::path data_dir;     // recreated
    std::string control_file_name;
    ControlFields fields;
};

class RunPreparer {
public:
    // Recreates the output and data directories and writes the rendered control file.
    PrepareResult prepare(const PrepareRequest& req) const;
};

} // namespace api
