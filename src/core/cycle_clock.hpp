#pragma once

#include <chrono>
#include <vector>

#include "util/time.hpp"

namespace core {

using util::TimePoint;

// Offsets of every cycle instant relative to the (hour-rounded) current time.
inline constexpr std::chrono::minutes kSystemStartOffset{-270};
inline constexpr std::chrono::minutes kStateEndOffset{-210};
inline constexpr std::chrono::minutes kWarmEndOffset{-240};
inline constexpr std::chrono::minutes kForecastStartOffset{0};
inline constexpr std::chrono::minutes kSystemEndOffset{360};
inline constexpr std::chrono::minutes kFailOffset{-360};

// Precip archive bounds used by reconciliation and gap filling.
inline constexpr std::chrono::minutes kHorizonOffset{-210};        // newest observed input needed
inline constexpr std::chrono::minutes kBulkSpanOffset{-570};       // empty-archive download start
inline constexpr std::chrono::minutes kNowcastEndOffset{150};      // last forecast frame
inline constexpr std::chrono::minutes kObservedRetention{210};     // kept before failTime
inline constexpr std::chrono::minutes kDuplicateBound{240};        // observed newer than current-4h is purged
inline constexpr std::chrono::minutes kStoreRetention{240};        // store entries kept

struct CycleClock {
    TimePoint current{};
    TimePoint system_start{};
    TimePoint system_state_end{};
    TimePoint system_warm_end{};
    TimePoint system_start_forecast{};
    TimePoint system_end{};
    TimePoint fail_time{};

    TimePoint horizon() const noexcept { return current + kHorizonOffset; }
    TimePoint bulk_span_start() const noexcept { return current + kBulkSpanOffset; }
    TimePoint nowcast_end() const noexcept { return current + kNowcastEndOffset; }
    TimePoint observed_expiry() const noexcept { return fail_time - kObservedRetention; }
    TimePoint duplicate_bound() const noexcept { return current - kDuplicateBound; }
    TimePoint store_expiry() const noexcept { return current - kStoreRetention; }
};

// Rounds `reference` down to the top of the hour and derives every cycle instant from it.
[[nodiscard]] CycleClock plan_cycle(TimePoint reference) noexcept;

// Inclusive 30-minute grid [first, last]. Empty when first > last.
[[nodiscard]] std::vector<TimePoint> cadence_grid(TimePoint first, TimePoint last);

} // namespace core
