// TimeUtils Header
#pragma once
#include <chrono>
#include <string>

namespace logicchat::infrastructure {

class TimeUtils {
public:
    /** @brief Formats an instant as ISO-8601 UTC with microseconds, e.g. 2024-05-01T09:30:00.000123Z. */
    static std::string ToIso8601Utc(std::chrono::system_clock::time_point instant);
};

} // namespace logicchat::infrastructure
