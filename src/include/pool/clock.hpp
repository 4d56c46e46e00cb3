#pragma once
/**
 * @file clock.hpp
 * @brief Monotonic clock alias and injectable time source for the pool.
 */

#include <chrono>
#include <functional>

namespace workerpool::pool
{

using Clock = std::chrono::steady_clock;

/// Time source held by component configs. Empty means Clock::now().
using ClockFn = std::function<Clock::time_point()>;

inline Clock::time_point now_from(const ClockFn &clock)
{
    return clock ? clock() : Clock::now();
}

/// Seconds as double, the unit every statistic and JSON report uses.
inline double seconds_between(Clock::time_point from, Clock::time_point to)
{
    return std::chrono::duration<double>(to - from).count();
}

} // namespace workerpool::pool
