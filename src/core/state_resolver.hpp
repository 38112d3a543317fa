#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/cycle_clock.hpp"

namespace core {

enum class StartClass : std::uint8_t {
    Cold,      // no complete snapshot set in (failTime, systemStart]
    Warm,      // complete set at systemStart
    Degraded   // complete set at an earlier 30-minute step
};

inline const char* start_class_name(StartClass c) noexcept {
    switch (c) {
    case StartClass::Cold: return "cold";
    case StartClass::Warm: return "warm";
    case StartClass::Degraded: return "degraded";
    }
    return "unknown";
}

struct StateResolution {
    TimePoint resolved_start{};
    StartClass start_class{StartClass::Cold};
    TimePoint earliest_checked{};                  // last instant the search looked at
    std::vector<std::string> missing_at_start;     // variables absent at systemStart
    bool states_dir_present{true};

    bool needs_alert() const noexcept { return start_class != StartClass::Warm; }
};

// Searches backward from clock.system_start in 30-minute steps, never reaching fail_time,
// for a time where every variable has a non-empty `{variable}_{YYYYMMDD_HHMM}.tif`.
class StateAvailabilityResolver {
public:
    StateAvailabilityResolver(std::filesystem::path states_dir, std::vector<std::string> variables);

    [[nodiscard]] StateResolution resolve(const CycleClock& clock) const;

    // Names of the variables without a usable snapshot at `t`.
    [[nodiscard]] std::vector<std::string> missing_at(TimePoint t) const;

private:
    std::filesystem::path states_dir_;
    std::vector<std::string> variables_;
};

} // namespace core
