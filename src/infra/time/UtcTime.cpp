#include "UtcTime.hpp"

#include <array>
#include <cstdio>

namespace utc {

std::tm get_safe_gmtime(std::time_t timer) {
    std::tm tm_snapshot{};
#if defined(_WIN32)
    gmtime_s(&tm_snapshot, &timer);
#else
    gmtime_r(&timer, &tm_snapshot);
#endif
    return tm_snapshot;
}

std::string FormatDatePath(Clock::time_point tp) {
    std::tm tm = get_safe_gmtime(Clock::to_time_t(tp));
    std::array<char, 16> buf{};
    std::strftime(buf.data(), buf.size(), "%Y/%m/%d", &tm);
    return buf.data();
}

std::string FormatIso8601(Clock::time_point tp) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    if (secs > tp) {
        secs -= std::chrono::seconds(1);  // floor for pre-epoch values
    }
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();

    std::tm tm = get_safe_gmtime(Clock::to_time_t(secs));
    std::array<char, 32> date{};
    std::strftime(date.data(), date.size(), "%Y-%m-%dT%H:%M:%S", &tm);

    std::array<char, 48> out{};
    std::snprintf(out.data(), out.size(), "%s.%03lldZ", date.data(),
                  static_cast<long long>(millis));
    return out.data();
}

}  // namespace utc
