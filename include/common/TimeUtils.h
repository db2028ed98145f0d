#pragma once
// ===================================================================
// UTC time helpers for trade timestamps (epoch milliseconds).
// Hour and weekday buckets are always computed in UTC.
// ===================================================================

#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <string>

namespace tradebrain {
namespace common {

inline long long nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// Epoch-ms time source. Empty means the system clock.
using Clock = std::function<long long()>;

inline long long readClock(const Clock& clock) {
    return clock ? clock() : nowMs();
}

inline std::tm toUtcTm(long long epoch_ms) {
    const std::time_t secs = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm out{};
#ifdef _WIN32
    gmtime_s(&out, &secs);
#else
    gmtime_r(&secs, &out);
#endif
    return out;
}

// 0-23
inline int utcHour(long long epoch_ms) {
    return toUtcTm(epoch_ms).tm_hour;
}

// 0=Monday ... 6=Sunday
inline int utcWeekday(long long epoch_ms) {
    const int sunday_based = toUtcTm(epoch_ms).tm_wday;
    return (sunday_based + 6) % 7;
}

// 2026-01-02T03:04:05.678Z
inline std::string toIso8601(long long epoch_ms) {
    const std::tm tm = toUtcTm(epoch_ms);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<int>(epoch_ms % 1000));
    return buf;
}

} // namespace common
} // namespace tradebrain
