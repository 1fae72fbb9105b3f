/**
 * @file timestamp.hpp
 * @brief Timestamp and time utility abstractions for FidasRelay
 *
 * Provides a clean abstraction layer for:
 * - Getting current time (wall clock and monotonic clock)
 * - Converting between time units
 * - Civil date <-> timestamp conversion and ISO-8601 formatting
 *
 * Measurements carry both a wall and a monotonic timestamp so that an NTP
 * step on the host does not scramble acquisition order.
 */

#pragma once

#include <chrono>
#include <thread>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace fidasrelay {

/**
 * @brief Timestamp type - uint64_t nanoseconds
 *
 * Wall timestamps count from the Unix epoch (UTC), monotonic timestamps
 * from an unspecified boot-relative origin.
 */
using Timestamp = uint64_t;

using Nanoseconds = std::chrono::nanoseconds;
using Milliseconds = std::chrono::milliseconds;

/**
 * @brief Broken-down civil time (no time zone attached)
 */
struct CivilTime {
    int year{1970};
    int month{1};   ///< 1..12
    int day{1};     ///< 1..31
    int hour{0};    ///< 0..23
    int minute{0};
    int second{0};
};

/**
 * @brief Time utility class - abstraction over clock sources
 *
 * Thread-safe: All methods are stateless.
 */
class Time {
public:
    /**
     * @brief Current wall time (UTC) in nanoseconds since epoch
     */
    static Timestamp wall_now() noexcept {
        auto now = std::chrono::system_clock::now();
        return static_cast<Timestamp>(
            std::chrono::duration_cast<Nanoseconds>(now.time_since_epoch()).count());
    }

    /**
     * @brief Current monotonic time in nanoseconds
     *
     * Real-time safe: Yes
     */
    static Timestamp monotonic_now() noexcept {
        struct timespec ts;
        if (clock_gettime(CLOCK_MONOTONIC, &ts) == 0) {
            return static_cast<Timestamp>(ts.tv_sec) * 1'000'000'000 +
                   static_cast<Timestamp>(ts.tv_nsec);
        }
        // Fallback to steady clock on error
        auto now = std::chrono::steady_clock::now();
        return static_cast<Timestamp>(
            std::chrono::duration_cast<Nanoseconds>(now.time_since_epoch()).count());
    }

    /**
     * @brief Convert std::chrono::duration to nanoseconds
     */
    template<typename Rep, typename Period>
    static constexpr Timestamp to_nanoseconds(std::chrono::duration<Rep, Period> duration) noexcept {
        return static_cast<Timestamp>(
            std::chrono::duration_cast<Nanoseconds>(duration).count());
    }

    /**
     * @brief Days since 1970-01-01 for a proleptic Gregorian date
     *
     * Howard Hinnant's days_from_civil.
     */
    static constexpr int64_t days_from_civil(int y, int m, int d) noexcept {
        y -= m <= 2 ? 1 : 0;
        const int64_t era = (y >= 0 ? y : y - 399) / 400;
        const int64_t yoe = y - era * 400;
        const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + doe - 719468;
    }

    /**
     * @brief Inverse of days_from_civil
     */
    static constexpr CivilTime civil_from_days(int64_t z) noexcept {
        z += 719468;
        const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const int64_t doe = z - era * 146097;
        const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const int64_t mp = (5 * doy + 2) / 153;
        const int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
        const int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
        const int y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
        return CivilTime{.year = y, .month = m, .day = d};
    }

    /**
     * @brief Convert a local civil time at a fixed UTC offset to a wall timestamp
     *
     * @param local Civil time as shown by the instrument clock
     * @param utc_offset_hours Offset of the instrument clock from UTC
     * @return UTC nanoseconds since epoch
     */
    static constexpr Timestamp from_civil(const CivilTime& local, int utc_offset_hours) noexcept {
        int64_t secs = days_from_civil(local.year, local.month, local.day) * 86400
                     + local.hour * 3600 + local.minute * 60 + local.second
                     - static_cast<int64_t>(utc_offset_hours) * 3600;
        return static_cast<Timestamp>(secs) * 1'000'000'000;
    }

    /**
     * @brief Format a wall timestamp as ISO-8601 with a fixed UTC offset
     *
     * Example: 2025-11-26T09:45:00+04:00
     */
    static std::string to_iso8601(Timestamp utc_ns, int utc_offset_hours) {
        int64_t secs = static_cast<int64_t>(utc_ns / 1'000'000'000)
                     + static_cast<int64_t>(utc_offset_hours) * 3600;
        int64_t days = secs >= 0 ? secs / 86400 : (secs - 86399) / 86400;
        int64_t rem = secs - days * 86400;
        CivilTime c = civil_from_days(days);

        int off = utc_offset_hours >= 0 ? utc_offset_hours : -utc_offset_hours;
        char buf[40];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d%c%02d:00",
                      c.year, c.month, c.day,
                      static_cast<int>(rem / 3600), static_cast<int>((rem % 3600) / 60),
                      static_cast<int>(rem % 60),
                      utc_offset_hours >= 0 ? '+' : '-', off);
        return buf;
    }

    template<typename Rep, typename Period>
    static void sleep(std::chrono::duration<Rep, Period> duration) noexcept {
        std::this_thread::sleep_for(duration);
    }
};

} // namespace fidasrelay
