#ifndef SEGSTORE_CORE_INTERVAL_RULE_H_
#define SEGSTORE_CORE_INTERVAL_RULE_H_

#include <string>

#include "segstore/core/result.h"
#include "segstore/core/types.h"

namespace segstore {
namespace core {

/**
 * @brief A time-bucket width: segment width or TTL horizon.
 *
 * All arithmetic is performed on UTC calendar time. MONTH steps follow the
 * calendar, so two consecutive MONTH buckets can differ in length.
 */
struct IntervalRule {
    enum class Unit {
        HOUR,
        DAY,
        WEEK,
        MONTH
    };

    Unit unit = Unit::DAY;
    int num = 1;

    IntervalRule() = default;
    IntervalRule(Unit u, int n) : unit(u), num(n) {}

    static IntervalRule Hours(int n) { return IntervalRule(Unit::HOUR, n); }
    static IntervalRule Days(int n) { return IntervalRule(Unit::DAY, n); }
    static IntervalRule Weeks(int n) { return IntervalRule(Unit::WEEK, n); }
    static IntervalRule Months(int n) { return IntervalRule(Unit::MONTH, n); }

    Result<void> validate() const;

    // Start of the unit containing ts (hour, day, Monday, first of month)
    Timestamp floor(Timestamp ts) const;
    // ts advanced by num units
    Timestamp next(Timestamp ts) const;
    // ts moved back by num units
    Timestamp prev(Timestamp ts) const;

    Duration estimated_duration() const;

    bool operator==(const IntervalRule& other) const {
        return unit == other.unit && num == other.num;
    }
    bool operator!=(const IntervalRule& other) const { return !(*this == other); }

    std::string to_string() const;
};

} // namespace core
} // namespace segstore

#endif // SEGSTORE_CORE_INTERVAL_RULE_H_
