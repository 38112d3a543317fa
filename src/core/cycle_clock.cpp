#include "core/cycle_clock.hpp"

namespace core {

CycleClock plan_cycle(TimePoint reference) noexcept {
    CycleClock clk{};
    clk.current = util::floor_to_hour(reference);
    clk.system_start = clk.current + kSystemStartOffset;
    clk.system_state_end = clk.current + kStateEndOffset;
    clk.system_warm_end = clk.current + kWarmEndOffset;
    clk.system_start_forecast = clk.current + kForecastStartOffset;
    clk.system_end = clk.current + kSystemEndOffset;
    clk.fail_time = clk.current + kFailOffset;
    return clk;
}

std::vector<TimePoint> cadence_grid(TimePoint first, TimePoint last) {
    std::vector<TimePoint> out;
    for (TimePoint t = first; t <= last; t += util::kCadence) {
        out.push_back(t);
    }
    return out;
}

} // namespace core
