#include "infrastructure/TimeUtils.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace logicchat::infrastructure {

std::string TimeUtils::ToIso8601Utc(std::chrono::system_clock::time_point instant) {
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(instant);
    if (seconds > instant) {
        seconds -= std::chrono::seconds(1);
    }
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(instant - seconds).count();

    std::time_t t = std::chrono::system_clock::to_time_t(seconds);
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &t);
#else
    gmtime_r(&t, &utc);
#endif

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return ss.str();
}

} // namespace logicchat::infrastructure
