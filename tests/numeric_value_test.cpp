#include "numsort/numeric_value.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <string>

using numsort::NumericValue;

TEST(NumericValueTest, KeepsItsKind)
{
    EXPECT_EQ(NumericValue::integer(5).kind(), NumericValue::Kind::Integer);
    EXPECT_EQ(NumericValue::real(5.0).kind(), NumericValue::Kind::Float);
    EXPECT_EQ(NumericValue::integer(-7).as_integer().str(), "-7");
    EXPECT_DOUBLE_EQ(NumericValue::real(2.5).as_float(), 2.5);
}

TEST(NumericValueTest, ComparesAcrossKinds)
{
    EXPECT_LT(NumericValue::real(-2.5), NumericValue::integer(0));
    EXPECT_LT(NumericValue::integer(2), NumericValue::real(2.5));
    EXPECT_GT(NumericValue::integer(3), NumericValue::real(2.99));
    EXPECT_EQ(NumericValue::integer(3), NumericValue::real(3.0));
    EXPECT_EQ(NumericValue::integer(0), NumericValue::real(-0.0));
    EXPECT_LT(NumericValue::integer(-3), NumericValue::real(-2.5));
    EXPECT_GT(NumericValue::integer(-2), NumericValue::real(-2.5));
}

TEST(NumericValueTest, LargeIntegersAreNotRoundedThroughDouble)
{
    // 2^53 + 1 has no exact double, converting would make it equal to 2^53
    const auto above = NumericValue::integer(9007199254740993LL);
    const auto boundary = NumericValue::real(9007199254740992.0);
    EXPECT_GT(above, boundary);
    EXPECT_EQ(numsort::compare(boundary, above), -1);

    const auto max = NumericValue::integer(std::numeric_limits<std::int64_t>::max());
    EXPECT_LT(max, NumericValue::real(9223372036854775808.0));
    const auto min = NumericValue::integer(std::numeric_limits<std::int64_t>::min());
    EXPECT_EQ(min, NumericValue::real(-9223372036854775808.0));
}

TEST(NumericValueTest, IntegersBeyondInt64CompareExactly)
{
    const auto huge = NumericValue::integer(numsort::DecimalInteger::parse("1" + std::string(400, '0')));
    const auto bigger = NumericValue::integer(numsort::DecimalInteger::parse("2" + std::string(400, '0')));
    EXPECT_LT(huge, bigger);
    EXPECT_GT(huge, NumericValue::real(1e308));
    EXPECT_LT(huge, NumericValue::real(std::numeric_limits<double>::infinity()));

    // 1e20 is exactly representable as a double
    const auto exact = NumericValue::integer(numsort::DecimalInteger::parse("100000000000000000000"));
    EXPECT_EQ(exact, NumericValue::real(1e20));
    const auto next = NumericValue::integer(numsort::DecimalInteger::parse("100000000000000000001"));
    EXPECT_GT(next, NumericValue::real(1e20));
    const auto negative = NumericValue::integer(numsort::DecimalInteger::parse("-100000000000000000001"));
    EXPECT_LT(negative, NumericValue::real(-1e20));
    EXPECT_GT(NumericValue::real(-1e20), negative);
}

TEST(NumericValueTest, InfinityBoundsEveryFiniteValue)
{
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_LT(NumericValue::integer(std::numeric_limits<std::int64_t>::max()), NumericValue::real(inf));
    EXPECT_GT(NumericValue::integer(std::numeric_limits<std::int64_t>::min()), NumericValue::real(-inf));
    EXPECT_LT(NumericValue::real(1e308), NumericValue::real(inf));
}

TEST(NumericValueTest, WholeValues)
{
    EXPECT_TRUE(numsort::is_whole(NumericValue::integer(12)));
    EXPECT_TRUE(numsort::is_whole(NumericValue::real(3.0)));
    EXPECT_TRUE(numsort::is_whole(NumericValue::real(-0.0)));
    EXPECT_FALSE(numsort::is_whole(NumericValue::real(5.25)));
    EXPECT_FALSE(numsort::is_whole(NumericValue::real(std::numeric_limits<double>::infinity())));
}
