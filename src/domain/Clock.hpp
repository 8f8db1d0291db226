/**
 * @file Clock.hpp
 * @brief Injectable wall-clock source.
 */

#pragma once

#include <chrono>
#include <functional>

namespace logicchat::domain {

using Clock = std::function<std::chrono::system_clock::time_point()>;

/** @brief The real system clock. */
inline Clock SystemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

/** @brief A clock frozen at the given instant (tests). */
inline Clock FixedClock(std::chrono::system_clock::time_point instant) {
    return [instant] { return instant; };
}

} // namespace logicchat::domain
