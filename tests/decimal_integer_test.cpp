#include "numsort/decimal_integer.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>

using numsort::DecimalInteger;

TEST(DecimalIntegerTest, ParsesAndNormalizes)
{
    EXPECT_EQ(DecimalInteger::parse("0042").str(), "42");
    EXPECT_EQ(DecimalInteger::parse("+7").str(), "7");
    EXPECT_EQ(DecimalInteger::parse("-15").str(), "-15");
    EXPECT_TRUE(DecimalInteger::parse("-0").is_zero());
    EXPECT_FALSE(DecimalInteger::parse("-0").negative());
    EXPECT_EQ(DecimalInteger::from_int64(std::numeric_limits<std::int64_t>::min()).str(),
              "-9223372036854775808");
}

TEST(DecimalIntegerTest, RejectsNonIntegers)
{
    EXPECT_THROW(DecimalInteger::parse(""), std::invalid_argument);
    EXPECT_THROW(DecimalInteger::parse("-"), std::invalid_argument);
    EXPECT_THROW(DecimalInteger::parse("1.5"), std::invalid_argument);
    EXPECT_THROW(DecimalInteger::parse("12a"), std::invalid_argument);
}

TEST(DecimalIntegerTest, OrdersBySignLengthThenDigits)
{
    EXPECT_LT(numsort::compare(DecimalInteger::parse("-100"), DecimalInteger::parse("-99")), 0);
    EXPECT_LT(numsort::compare(DecimalInteger::parse("-1"), DecimalInteger::parse("0")), 0);
    EXPECT_LT(numsort::compare(DecimalInteger::parse("99"), DecimalInteger::parse("100")), 0);
    EXPECT_LT(numsort::compare(DecimalInteger::parse("12345678901234567890"),
                               DecimalInteger::parse("12345678901234567891")),
              0);
    EXPECT_EQ(numsort::compare(DecimalInteger::parse("-0"), DecimalInteger::parse("000")), 0);
    EXPECT_GT(numsort::compare(DecimalInteger::parse("2" + std::string(400, '0')),
                               DecimalInteger::parse("1" + std::string(400, '9'))),
              0);
}
