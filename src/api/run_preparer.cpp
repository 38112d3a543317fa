#include "api/run_preparer.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#include "util/log.hpp"

namespace api {
namespace {

PrepareResult fail(std::string detail) {
    util::log(util::LogLevel::Error, "RunPreparer: %s", detail.c_str());
    PrepareResult res{};
    res.errors.push_back({core::Stage::Prepare, core::StageErrorKind::PrepFailure, std::move(detail)});
    return res;
}

bool remove_dir(const std::filesystem::path& dir, std::string& error) {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    if (ec) {
        error = "remove " + dir.string() + ": " + ec.message();
        return false;
    }
    return true;
}

bool make_dir(const std::filesystem::path& dir, std::string& error) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        error = "mkdir " + dir.string() + ": " + ec.message();
        return false;
    }
    return true;
}

} // namespace

std::string render_template(std::string_view text, const FieldTable& fields) {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto open = text.find('{', pos);
        if (open == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, open - pos));
        const auto close = text.find('}', open + 1);
        if (close == std::string_view::npos) {
            out.append(text.substr(open));
            break;
        }
        // A nested '{' restarts the scan there so "{{TIMEEND}" still renders the inner token.
        const auto reopen = text.find('{', open + 1);
        if (reopen != std::string_view::npos && reopen < close) {
            out.append(text.substr(open, reopen - open));
            pos = reopen;
            continue;
        }
        const std::string_view token = text.substr(open + 1, close - open - 1);
        bool replaced = false;
        for (const auto& [name, value] : fields) {
            if (token == name) {
                out.append(value);
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            out.append(text.substr(open, close - open + 1));
        }
        pos = close + 1;
    }
    return out;
}

FieldTable control_field_table(const ControlFields& f) {
    return {
        {"OUTPUTPATH", f.output_path.string()},
        {"STATESPATH", f.states_path.string()},
        {"TIMEBEGIN", util::stamp12(f.resolved_start)},
        {"TIMEBEGINLR", util::stamp12(f.forecast_start)},
        {"TIMEWARMEND", util::stamp12(f.warm_end)},
        {"TIMESTATE", util::stamp12(f.state_end)},
        {"TIMEEND", util::stamp12(f.end)},
        {"SYSTEMMODEL", f.model_name},
    };
}

ControlFields control_fields_for(const core::CycleClock& clock,
                                 util::TimePoint resolved_start,
                                 const std::filesystem::path& output_path,
                                 const std::filesystem::path& states_path,
                                 const std::string& model_name) {
    ControlFields f;
    f.output_path = output_path;
    f.states_path = states_path;
    f.resolved_start = resolved_start;
    f.forecast_start = clock.system_start_forecast;
    f.warm_end = clock.system_warm_end;
    f.state_end = clock.system_state_end;
    f.end = clock.system_end;
    f.model_name = model_name;
    return f;
}

PrepareResult RunPreparer::prepare(const PrepareRequest& req) const {
    std::ifstream in(req.template_path, std::ios::binary);
    if (!in.is_open()) {
        return fail("cannot open template " + req.template_path.string());
    }
    std::ostringstream text;
    text << in.rdbuf();
    if (in.bad()) {
        return fail("cannot read template " + req.template_path.string());
    }

    std::string err;
    // Both removals first: the output directory normally lives inside the data directory.
    if (!remove_dir(req.output_dir, err) || !remove_dir(req.data_dir, err) ||
        !make_dir(req.output_dir, err) || !make_dir(req.data_dir, err)) {
        return fail(err);
    }

    const auto control = req.output_dir / req.control_file_name;
    std::ofstream out(control, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return fail("cannot create " + control.string());
    }
    out << render_template(text.str(), control_field_table(req.fields));
    out.flush();
    if (!out) {
        return fail("write failed for " + control.string());
    }
    util::log(util::LogLevel::Info, "Control file written to %s", control.string().c_str());

    PrepareResult res{};
    res.ok = true;
    res.control_file = control;
    return res;
}

} // namespace api
