#include "core/state_resolver.hpp"

#include <system_error>
#include <utility>

#include "core/precip_file.hpp"
#include "util/log.hpp"

namespace core {

StateAvailabilityResolver::StateAvailabilityResolver(std::filesystem::path states_dir,
                                                     std::vector<std::string> variables)
    : states_dir_(std::move(states_dir)), variables_(std::move(variables)) {}

std::vector<std::string> StateAvailabilityResolver::missing_at(TimePoint t) const {
    std::vector<std::string> missing;
    for (const auto& var : variables_) {
        const auto p = states_dir_ / state_file_name(var, t);
        if (!is_non_zero_file(p)) {
            missing.push_back(var);
        }
    }
    return missing;
}

StateResolution StateAvailabilityResolver::resolve(const CycleClock& clock) const {
    StateResolution res{};
    std::error_code ec;
    res.states_dir_present = std::filesystem::is_directory(states_dir_, ec) && !ec;
    if (!res.states_dir_present) {
        util::log(util::LogLevel::Error, "States directory %s does not exist; check paths.states",
                  states_dir_.string().c_str());
    }

    util::log(util::LogLevel::Info, "Looking for states from %s back to %s",
              util::human_stamp(clock.system_start).c_str(), util::human_stamp(clock.fail_time).c_str());

    TimePoint t = clock.system_start;
    bool found = false;
    while (!found && t > clock.fail_time) {
        const auto missing = missing_at(t);
        if (t == clock.system_start) {
            res.missing_at_start = missing;
        }
        res.earliest_checked = t;
        if (missing.empty()) {
            found = true;
            break;
        }
        for (const auto& var : missing) {
            util::log(util::LogLevel::Info, "Missing start state: %s",
                      (states_dir_ / state_file_name(var, t)).string().c_str());
        }
        t -= util::kCadence;
    }

    if (!found) {
        res.start_class = StartClass::Cold;
        res.resolved_start = clock.system_start;
        util::log(util::LogLevel::Warn, "No states found between %s and %s; starting cold",
                  util::human_stamp(res.earliest_checked).c_str(),
                  util::human_stamp(clock.system_start).c_str());
    } else if (t == clock.system_start) {
        res.start_class = StartClass::Warm;
        res.resolved_start = t;
    } else {
        res.start_class = StartClass::Degraded;
        res.resolved_start = t;
        util::log(util::LogLevel::Warn, "Had to use older states from %s instead of %s",
                  util::human_stamp(t).c_str(), util::human_stamp(clock.system_start).c_str());
    }
    return res;
}

} // namespace core
