#pragma once

#include <chrono>
#include <string>

namespace rackscan::core::util {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Formats a time point as UTC text with millisecond precision.
 *
 * The format ("YYYY-MM-DD HH:MM:SS.mmm") sorts lexicographically in time
 * order, which the stores rely on for cutoff comparisons.
 */
std::string formatTimestamp(const TimePoint& tp);

/**
 * @brief Parses text produced by formatTimestamp().
 *
 * The millisecond part is optional so that SQLite CURRENT_TIMESTAMP
 * defaults can be read back as well.
 */
TimePoint parseTimestamp(const std::string& str);

/**
 * @brief Current wall clock time truncated to milliseconds.
 */
TimePoint now();

} // namespace rackscan::core::util
