#pragma once
#include <cstdint>
#include <string>

namespace numsort
{
    /**
     * @class DecimalInteger: integer of any length kept as sign + decimal digits
     * @param negative_ : never set for zero
     * @param magnitude_ : ASCII digits without leading zeros, "0" for zero
     * Tokens are stored exactly as read, so two long integers never collapse into one value.
     */
    class DecimalInteger
    {
    public:
        // [+-]?[0-9]+, throws std::invalid_argument otherwise
        static DecimalInteger parse(const std::string &text);
        static DecimalInteger from_int64(std::int64_t value);

        bool negative() const { return negative_; }
        bool is_zero() const { return magnitude_ == "0"; }
        const std::string &magnitude() const { return magnitude_; }
        std::string str() const;

    private:
        DecimalInteger(bool negative, std::string magnitude);

        bool negative_;
        std::string magnitude_;
    };

    // length first, then digit by digit; both sides without leading zeros
    int compare_magnitude(const std::string &lhs, const std::string &rhs);
    int compare(const DecimalInteger &lhs, const DecimalInteger &rhs);
}
