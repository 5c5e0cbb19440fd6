#include "core/util/Time.hpp"

#include <cstdio>
#include <ctime>

namespace rackscan::core::util {

std::string formatTimestamp(const TimePoint& tp) {
    auto secs = std::chrono::floor<std::chrono::seconds>(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();

    auto time = std::chrono::system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&time, &tm);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);

    char result[40];
    std::snprintf(result, sizeof(result), "%s.%03d", buffer, static_cast<int>(millis));
    return result;
}

TimePoint parseTimestamp(const std::string& str) {
    std::tm tm{};
    const char* rest = strptime(str.c_str(), "%Y-%m-%d %H:%M:%S", &tm);
    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));

    if (rest && *rest == '.') {
        int millis = 0;
        if (std::sscanf(rest + 1, "%3d", &millis) == 1) {
            tp += std::chrono::milliseconds(millis);
        }
    }
    return tp;
}

TimePoint now() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

} // namespace rackscan::core::util
