#include <gtest/gtest.h>
#include "segstore/core/interval_rule.h"

namespace segstore {
namespace core {
namespace {

TEST(IntervalRuleTest, ValidateRejectsNonPositive) {
    EXPECT_TRUE(IntervalRule::Days(1).validate().ok());
    EXPECT_FALSE(IntervalRule::Days(0).validate().ok());

    auto result = IntervalRule::Hours(-2).validate();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), Error::Code::INVALID_ARGUMENT);
}

TEST(IntervalRuleTest, FloorHourAndDay) {
    Timestamp ts = FromCivil(2024, 5, 1, 13, 42, 7) + 123;
    EXPECT_EQ(IntervalRule::Hours(1).floor(ts), FromCivil(2024, 5, 1, 13));
    EXPECT_EQ(IntervalRule::Days(1).floor(ts), FromCivil(2024, 5, 1));
}

TEST(IntervalRuleTest, FloorWeekStartsMonday) {
    // 2024-05-01 is a Wednesday
    Timestamp wed = FromCivil(2024, 5, 1, 10);
    EXPECT_EQ(IntervalRule::Weeks(1).floor(wed), FromCivil(2024, 4, 29));

    Timestamp monday = FromCivil(2024, 4, 29);
    EXPECT_EQ(IntervalRule::Weeks(1).floor(monday), monday);

    Timestamp sunday = FromCivil(2024, 5, 5, 23);
    EXPECT_EQ(IntervalRule::Weeks(1).floor(sunday), FromCivil(2024, 4, 29));
}

TEST(IntervalRuleTest, FloorMonth) {
    EXPECT_EQ(IntervalRule::Months(1).floor(FromCivil(2024, 2, 29, 5)), FromCivil(2024, 2, 1));
}

TEST(IntervalRuleTest, NextAndPrev) {
    Timestamp start = FromCivil(2024, 5, 1);
    EXPECT_EQ(IntervalRule::Days(3).next(start), FromCivil(2024, 5, 4));
    EXPECT_EQ(IntervalRule::Days(3).prev(start), FromCivil(2024, 4, 28));
    EXPECT_EQ(IntervalRule::Hours(6).next(start), FromCivil(2024, 5, 1, 6));
    EXPECT_EQ(IntervalRule::Weeks(2).next(start), FromCivil(2024, 5, 15));
}

TEST(IntervalRuleTest, MonthsFollowCalendar) {
    EXPECT_EQ(IntervalRule::Months(1).next(FromCivil(2024, 1, 1)), FromCivil(2024, 2, 1));
    EXPECT_EQ(IntervalRule::Months(1).next(FromCivil(2024, 12, 1)), FromCivil(2025, 1, 1));
    EXPECT_EQ(IntervalRule::Months(1).prev(FromCivil(2024, 1, 1)), FromCivil(2023, 12, 1));
    // Day clamps to the shorter month
    EXPECT_EQ(IntervalRule::Months(1).next(FromCivil(2024, 1, 31)), FromCivil(2024, 2, 29));
}

TEST(IntervalRuleTest, EstimatedDuration) {
    EXPECT_EQ(IntervalRule::Hours(2).estimated_duration(), 2 * kNanosPerHour);
    EXPECT_EQ(IntervalRule::Weeks(1).estimated_duration(), 7 * kNanosPerDay);
    EXPECT_EQ(IntervalRule::Months(1).estimated_duration(), 30 * kNanosPerDay);
}

TEST(IntervalRuleTest, ToStringAndEquality) {
    EXPECT_EQ(IntervalRule::Days(3).to_string(), "3d");
    EXPECT_EQ(IntervalRule::Hours(1).to_string(), "1h");
    EXPECT_EQ(IntervalRule::Days(1), IntervalRule(IntervalRule::Unit::DAY, 1));
    EXPECT_NE(IntervalRule::Days(1), IntervalRule::Hours(24));
}

} // namespace
} // namespace core
} // namespace segstore
