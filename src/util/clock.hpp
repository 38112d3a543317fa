#pragma once

#include <chrono>

namespace util {

// Thin clock abstraction so real-time and hindcast cycles share one code path.
class SystemClock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~SystemClock() = default;
    virtual time_point now() const noexcept { return std::chrono::system_clock::now(); }
};

// Always reports the same instant; used by tests and hindcast tooling.
class FixedSystemClock : public SystemClock {
public:
    explicit FixedSystemClock(time_point at) noexcept : at_(at) {}

    time_point now() const noexcept override { return at_; }

private:
    time_point at_;
};

} // namespace util
