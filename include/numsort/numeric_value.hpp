#pragma once
#include "decimal_integer.hpp"

#include <cstdint>
#include <utility>
#include <variant>
#include <vector>

namespace numsort
{
    /**
     * @class NumericValue: one number read from the input text
     * holds an exact DecimalInteger when its token had no '.', a double otherwise.
     * The kind is fixed at extraction time and travels with the value up to the
     * formatter, so "3.0" stays a Float even though it prints as "3".
     */
    class NumericValue
    {
    public:
        enum class Kind
        {
            Integer,
            Float
        };

        static NumericValue integer(DecimalInteger value)
        {
            return NumericValue(Payload(std::in_place_index<0>, std::move(value)));
        }
        static NumericValue integer(std::int64_t value)
        {
            return integer(DecimalInteger::from_int64(value));
        }
        static NumericValue real(double value)
        {
            return NumericValue(Payload(std::in_place_index<1>, value));
        }

        Kind kind() const { return value_.index() == 0 ? Kind::Integer : Kind::Float; }
        bool is_integer() const { return kind() == Kind::Integer; }
        bool is_float() const { return kind() == Kind::Float; }

        const DecimalInteger &as_integer() const { return std::get<0>(value_); }
        double as_float() const { return std::get<1>(value_); }

    private:
        using Payload = std::variant<DecimalInteger, double>;
        explicit NumericValue(Payload value) : value_(std::move(value)) {}

        Payload value_;
    };

    using NumberSequence = std::vector<NumericValue>;

    /**
     * three-way comparison by exact mathematical value, also across kinds:
     * returns <0, 0 or >0. Integers are never rounded through double.
     */
    int compare(const NumericValue &lhs, const NumericValue &rhs);

    // Integer values are always whole, a Float only when finite with a zero fraction
    bool is_whole(const NumericValue &value);

    inline bool operator<(const NumericValue &lhs, const NumericValue &rhs) { return compare(lhs, rhs) < 0; }
    inline bool operator>(const NumericValue &lhs, const NumericValue &rhs) { return compare(lhs, rhs) > 0; }
    inline bool operator<=(const NumericValue &lhs, const NumericValue &rhs) { return compare(lhs, rhs) <= 0; }
    inline bool operator>=(const NumericValue &lhs, const NumericValue &rhs) { return compare(lhs, rhs) >= 0; }
    // equality is by value: integer 3 == float 3.0
    inline bool operator==(const NumericValue &lhs, const NumericValue &rhs) { return compare(lhs, rhs) == 0; }
    inline bool operator!=(const NumericValue &lhs, const NumericValue &rhs) { return compare(lhs, rhs) != 0; }
}
