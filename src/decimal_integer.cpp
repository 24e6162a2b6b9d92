#include "numsort/decimal_integer.hpp"

#include <stdexcept>
#include <utility>

namespace numsort
{
    DecimalInteger::DecimalInteger(bool negative, std::string magnitude)
        : negative_(negative), magnitude_(std::move(magnitude))
    {
        const auto first = magnitude_.find_first_not_of('0');
        if (first == std::string::npos)
            magnitude_ = "0";
        else if (first > 0)
            magnitude_.erase(0, first);
        if (is_zero())
            negative_ = false;
    }

    DecimalInteger DecimalInteger::parse(const std::string &text)
    {
        std::size_t start = 0;
        bool negative = false;
        if (!text.empty() && (text[0] == '+' || text[0] == '-'))
        {
            negative = text[0] == '-';
            start = 1;
        }
        if (start == text.size())
            throw std::invalid_argument("not an integer: '" + text + "'");
        for (std::size_t i = start; i < text.size(); ++i)
        {
            if (text[i] < '0' || text[i] > '9')
                throw std::invalid_argument("not an integer: '" + text + "'");
        }
        return DecimalInteger(negative, text.substr(start));
    }

    DecimalInteger DecimalInteger::from_int64(std::int64_t value)
    {
        return parse(std::to_string(value));
    }

    std::string DecimalInteger::str() const
    {
        return negative_ ? "-" + magnitude_ : magnitude_;
    }

    int compare_magnitude(const std::string &lhs, const std::string &rhs)
    {
        if (lhs.size() != rhs.size())
            return lhs.size() < rhs.size() ? -1 : 1;
        const int order = lhs.compare(rhs);
        return (order < 0) ? -1 : (order > 0) ? 1 : 0;
    }

    int compare(const DecimalInteger &lhs, const DecimalInteger &rhs)
    {
        if (lhs.negative() != rhs.negative())
            return lhs.negative() ? -1 : 1;
        const int order = compare_magnitude(lhs.magnitude(), rhs.magnitude());
        return lhs.negative() ? -order : order;
    }
}
