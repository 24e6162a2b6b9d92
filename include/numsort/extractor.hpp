#pragma once
#include "numeric_value.hpp"

#include <filesystem>
#include <string>

namespace numsort
{
    /**
     * drops every maximal invalid UTF-8 subsequence from raw bytes and keeps the rest,
     * bytes on both sides of a dropped sequence end up adjacent.
     */
    std::string decode_utf8_lossy(const std::string &bytes);

    // "5" -> Integer, "5.0" -> Float; int64 overflow falls back to Float
    NumericValue parse_token(const std::string &token);

    // every match of [+-]?[0-9]+(\.[0-9]+)? in order of appearance
    NumberSequence extract_numbers(const std::string &text);

    // read -> decode -> extract; throws std::runtime_error if the file cannot be read
    NumberSequence read_numbers(const std::filesystem::path &path);
}
