#ifndef SEGSTORE_CORE_TYPES_H_
#define SEGSTORE_CORE_TYPES_H_

#include <cstdint>
#include <string>

namespace segstore {
namespace core {

/**
 * @brief Represents a timestamp in nanoseconds since Unix epoch (UTC)
 */
using Timestamp = int64_t;

/**
 * @brief Represents a duration in nanoseconds
 */
using Duration = int64_t;

constexpr Duration kNanosPerSecond = 1'000'000'000LL;
constexpr Duration kNanosPerMinute = 60 * kNanosPerSecond;
constexpr Duration kNanosPerHour = 60 * kNanosPerMinute;
constexpr Duration kNanosPerDay = 24 * kNanosPerHour;

/**
 * @brief Broken-down UTC calendar time
 */
struct CivilTime {
    int64_t year = 1970;
    int month = 1;    // 1..12
    int day = 1;      // 1..31
    int hour = 0;
    int minute = 0;
    int second = 0;
    int64_t nanos = 0;
    int weekday = 4;  // 0 = Sunday; 1970-01-01 was a Thursday
};

CivilTime ToCivil(Timestamp ts);
Timestamp FromCivil(int64_t year, int month, int day, int hour = 0, int minute = 0, int second = 0);

/**
 * @brief Formats a timestamp as RFC3339 in UTC, e.g. 2024-05-01T00:00:00Z
 */
std::string FormatRFC3339(Timestamp ts);

/**
 * @brief Time range, half-open [start, end) unless configured otherwise
 */
struct TimeRange {
    Timestamp start = 0;
    Timestamp end = 0;
    bool include_start = true;
    bool include_end = false;

    TimeRange() = default;
    TimeRange(Timestamp s, Timestamp e, bool inc_start = true, bool inc_end = false)
        : start(s), end(e), include_start(inc_start), include_end(inc_end) {}

    bool contains(Timestamp ts) const;
    bool overlaps(const TimeRange& other) const;
    bool operator==(const TimeRange& other) const;
    std::string to_string() const;
};

/**
 * @brief Identifies a table inside the store, used for logging and metrics
 */
struct Position {
    std::string module;
    std::string group;
    std::string shard;
    std::string segment;

    std::string to_string() const;
};

} // namespace core
} // namespace segstore

#endif // SEGSTORE_CORE_TYPES_H_
