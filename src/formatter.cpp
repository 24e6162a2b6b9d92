#include "numsort/formatter.hpp"
#include "spdlog/fmt/fmt.h"

#include <string>

namespace numsort
{
    std::string format_value(const NumericValue &value)
    {
        if (value.is_integer())
            return value.as_integer().str();

        const double real = value.as_float();
        if (!is_whole(value))
            return fmt::format("{}", real);
        // whole floats drop the decimal point; -0.0 prints as 0
        if (real == 0.0)
            return "0";
        return fmt::format("{:.0f}", real);
    }

    std::string join_values(const NumberSequence &sequence)
    {
        std::string line;
        for (std::size_t i = 0; i < sequence.size(); ++i)
        {
            if (i)
                line += ' ';
            line += format_value(sequence[i]);
        }
        return line;
    }
}
