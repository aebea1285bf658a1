#pragma once
#include <chrono>
#include <ctime>
#include <string>

namespace utc {

using Clock = std::chrono::system_clock;

// Thread-safe gmtime.
std::tm get_safe_gmtime(std::time_t timer);

/**
 * @brief Calendar-day partition used in destination keys.
 * @return "YYYY/MM/DD" for the UTC day containing @p tp.
 */
std::string FormatDatePath(Clock::time_point tp);

/**
 * @brief ISO-8601 UTC timestamp with millisecond precision,
 * e.g. "2024-03-01T12:00:05.123Z".
 */
std::string FormatIso8601(Clock::time_point tp);

}  // namespace utc
