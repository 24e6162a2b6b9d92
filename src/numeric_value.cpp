#include "numsort/numeric_value.hpp"
#include "spdlog/fmt/fmt.h"

#include <cmath>

namespace
{
    int three_way(double lhs, double rhs)
    {
        return (lhs < rhs) ? -1 : (lhs > rhs) ? 1 : 0;
    }

    /**
     * exact integer vs double ordering. The integral part of a finite double is printed
     * with all its digits and compared as a DecimalInteger, the fraction breaks ties.
     */
    int compare_integer_float(const numsort::DecimalInteger &integer, double real)
    {
        if (std::isinf(real))
            return real > 0 ? -1 : 1;
        const double integral = std::trunc(real);
        const auto whole = numsort::DecimalInteger::parse(fmt::format("{:.0f}", integral));
        const int order = numsort::compare(integer, whole);
        if (order != 0)
            return order;
        return three_way(0.0, real - integral);
    }
}

namespace numsort
{
    int compare(const NumericValue &lhs, const NumericValue &rhs)
    {
        if (lhs.is_integer() && rhs.is_integer())
            return compare(lhs.as_integer(), rhs.as_integer());
        if (lhs.is_float() && rhs.is_float())
            return three_way(lhs.as_float(), rhs.as_float());
        if (lhs.is_integer())
            return compare_integer_float(lhs.as_integer(), rhs.as_float());
        return -compare_integer_float(rhs.as_integer(), lhs.as_float());
    }

    bool is_whole(const NumericValue &value)
    {
        if (value.is_integer())
            return true;
        const double real = value.as_float();
        return std::isfinite(real) && std::trunc(real) == real;
    }
}
