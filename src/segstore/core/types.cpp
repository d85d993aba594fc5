#include "segstore/core/types.h"
#include <cstdio>

namespace segstore {
namespace core {

namespace {

// Proleptic Gregorian conversions, valid for the whole int64 day range we use.
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2;
}

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

} // namespace

CivilTime ToCivil(Timestamp ts) {
    CivilTime ct;
    int64_t days = floor_div(ts, kNanosPerDay);
    int64_t rem = ts - days * kNanosPerDay;

    int64_t y;
    unsigned m, d;
    civil_from_days(days, y, m, d);
    ct.year = y;
    ct.month = static_cast<int>(m);
    ct.day = static_cast<int>(d);
    ct.hour = static_cast<int>(rem / kNanosPerHour);
    rem %= kNanosPerHour;
    ct.minute = static_cast<int>(rem / kNanosPerMinute);
    rem %= kNanosPerMinute;
    ct.second = static_cast<int>(rem / kNanosPerSecond);
    ct.nanos = rem % kNanosPerSecond;
    int64_t wd = (days + 4) % 7;
    ct.weekday = static_cast<int>(wd < 0 ? wd + 7 : wd);
    return ct;
}

Timestamp FromCivil(int64_t year, int month, int day, int hour, int minute, int second) {
    int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return days * kNanosPerDay + hour * kNanosPerHour + minute * kNanosPerMinute +
           second * kNanosPerSecond;
}

std::string FormatRFC3339(Timestamp ts) {
    CivilTime ct = ToCivil(ts);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04lld-%02d-%02dT%02d:%02d:%02dZ",
                  static_cast<long long>(ct.year), ct.month, ct.day,
                  ct.hour, ct.minute, ct.second);
    return buf;
}

bool TimeRange::contains(Timestamp ts) const {
    bool after_start = include_start ? ts >= start : ts > start;
    bool before_end = include_end ? ts <= end : ts < end;
    return after_start && before_end;
}

bool TimeRange::overlaps(const TimeRange& other) const {
    bool starts_before_other_ends = (include_start && other.include_end) ? start <= other.end : start < other.end;
    bool ends_after_other_starts = (include_end && other.include_start) ? end >= other.start : end > other.start;
    return starts_before_other_ends && ends_after_other_starts;
}

bool TimeRange::operator==(const TimeRange& other) const {
    return start == other.start && end == other.end &&
           include_start == other.include_start && include_end == other.include_end;
}

std::string TimeRange::to_string() const {
    return std::string(include_start ? "[" : "(") + FormatRFC3339(start) + ", " +
           FormatRFC3339(end) + (include_end ? "]" : ")");
}

std::string Position::to_string() const {
    return module + "/" + group + "/" + segment + "/" + shard;
}

} // namespace core
} // namespace segstore
