#include "segstore/core/interval_rule.h"

namespace segstore {
namespace core {

namespace {

Timestamp add_months(Timestamp ts, int64_t months) {
    CivilTime ct = ToCivil(ts);
    int64_t total = ct.year * 12 + (ct.month - 1) + months;
    int64_t year = total >= 0 ? total / 12 : (total - 11) / 12;
    int month = static_cast<int>(total - year * 12) + 1;

    // Clamp the day to the target month length.
    int day = ct.day;
    Timestamp first_of_next = month == 12 ? FromCivil(year + 1, 1, 1) : FromCivil(year, month + 1, 1);
    int days_in_month = static_cast<int>((first_of_next - FromCivil(year, month, 1)) / kNanosPerDay);
    if (day > days_in_month) {
        day = days_in_month;
    }
    return FromCivil(year, month, day, ct.hour, ct.minute, ct.second) + ct.nanos;
}

} // namespace

Result<void> IntervalRule::validate() const {
    if (num <= 0) {
        return Result<void>::error("interval num must be positive, got " + std::to_string(num),
                                   Error::Code::INVALID_ARGUMENT);
    }
    return Result<void>();
}

Timestamp IntervalRule::floor(Timestamp ts) const {
    CivilTime ct = ToCivil(ts);
    switch (unit) {
        case Unit::HOUR:
            return FromCivil(ct.year, ct.month, ct.day, ct.hour);
        case Unit::DAY:
            return FromCivil(ct.year, ct.month, ct.day);
        case Unit::WEEK: {
            // ISO weeks start on Monday
            int since_monday = (ct.weekday + 6) % 7;
            return FromCivil(ct.year, ct.month, ct.day) - since_monday * kNanosPerDay;
        }
        case Unit::MONTH:
            return FromCivil(ct.year, ct.month, 1);
    }
    return ts;
}

Timestamp IntervalRule::next(Timestamp ts) const {
    switch (unit) {
        case Unit::HOUR:
            return ts + num * kNanosPerHour;
        case Unit::DAY:
            return ts + num * kNanosPerDay;
        case Unit::WEEK:
            return ts + num * 7 * kNanosPerDay;
        case Unit::MONTH:
            return add_months(ts, num);
    }
    return ts;
}

Timestamp IntervalRule::prev(Timestamp ts) const {
    switch (unit) {
        case Unit::HOUR:
            return ts - num * kNanosPerHour;
        case Unit::DAY:
            return ts - num * kNanosPerDay;
        case Unit::WEEK:
            return ts - num * 7 * kNanosPerDay;
        case Unit::MONTH:
            return add_months(ts, -static_cast<int64_t>(num));
    }
    return ts;
}

Duration IntervalRule::estimated_duration() const {
    switch (unit) {
        case Unit::HOUR:
            return num * kNanosPerHour;
        case Unit::DAY:
            return num * kNanosPerDay;
        case Unit::WEEK:
            return num * 7 * kNanosPerDay;
        case Unit::MONTH:
            return num * 30 * kNanosPerDay;
    }
    return 0;
}

std::string IntervalRule::to_string() const {
    const char* suffix = "d";
    switch (unit) {
        case Unit::HOUR: suffix = "h"; break;
        case Unit::DAY: suffix = "d"; break;
        case Unit::WEEK: suffix = "w"; break;
        case Unit::MONTH: suffix = "M"; break;
    }
    return std::to_string(num) + suffix;
}

} // namespace core
} // namespace segstore
