#pragma once

#include <chrono>
#include <cstdio>
#include <string>


namespace raidlink::core {

// ============================================================================
// Timestamp type
// ============================================================================
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

[[nodiscard]]
inline Timestamp now_utc() noexcept {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}


// ============================================================================
// ISO-8601 / RFC3339 formatter (always UTC, millisecond precision)
//
// Produces:
//   YYYY-MM-DDTHH:MM:SS.sssZ
// ============================================================================
[[nodiscard]]
inline std::string to_iso8601(const Timestamp& ts) {
    using namespace std::chrono;

    sys_days d = floor<days>(ts);
    year_month_day ymd{d};

    auto tod = ts - d; // time of day
    auto h = floor<hours>(tod);
    auto m = floor<minutes>(tod - h);
    auto s = floor<seconds>(tod - h - m);
    auto ms = duration_cast<milliseconds>(tod - h - m - s).count();

    int year = int(ymd.year());
    unsigned mon = unsigned(ymd.month());
    unsigned day = unsigned(ymd.day());
    int hour = int(h.count());
    int minute = int(m.count());
    int sec = int(s.count());

    char buf[40];
    std::snprintf(buf, sizeof(buf),
                  "%04d-%02u-%02uT%02d:%02d:%02d.%03lldZ",
                  year, mon, day, hour, minute, sec,
                  static_cast<long long>(ms));

    return std::string(buf);
}

} // namespace raidlink::core
