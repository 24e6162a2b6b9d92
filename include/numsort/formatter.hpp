#pragma once
#include "numeric_value.hpp"

#include <string>

namespace numsort
{
    // Integer and whole Float -> plain digits, other Float -> shortest round-trip text
    std::string format_value(const NumericValue &value);

    // rendered values separated by a single space, no trailing newline
    std::string join_values(const NumberSequence &sequence);
}
