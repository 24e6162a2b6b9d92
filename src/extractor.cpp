/**
 * @file extractor.cpp
 * Project: numsort, bubble sort over the numbers found in a text file
 * You are free to use, modify, and distribute this code for educational purposes.
 */
#include "numsort/extractor.hpp"
#include "numsort/common.hpp"
#include "spdlog/spdlog.h"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>

namespace
{
    // longest well-formed UTF-8 sequence
    constexpr std::size_t MAX_SEQUENCE = 4;

    /**
     * decodes the code point starting at pos and moves pos past it. An ill-formed
     * sequence returns a negative value and pos skips its maximal subpart.
     * U8_NEXT runs on a window of at most 4 bytes so its int32_t offsets never overflow.
     */
    UChar32 next_code_point(const std::string &text, std::size_t &pos)
    {
        const auto *bytes = reinterpret_cast<const uint8_t *>(text.data()) + pos;
        const auto length = static_cast<int32_t>(std::min(MAX_SEQUENCE, text.size() - pos));
        int32_t offset = 0;
        UChar32 code_point;
        U8_NEXT(bytes, offset, length, code_point);
        pos += static_cast<std::size_t>(offset);
        return code_point;
    }

    /**
     * consumes a run of decimal digits (Unicode category Nd, so '٣' counts as 3) starting
     * at pos and appends their ASCII form to out.
     * @return number of digits consumed
     */
    std::size_t take_digits(const std::string &text, std::size_t &pos, std::string &out)
    {
        std::size_t taken = 0;
        while (pos < text.size())
        {
            const char c = text[pos];
            if (c >= '0' && c <= '9')
            {
                out.push_back(c);
                ++pos;
                ++taken;
                continue;
            }
            if (static_cast<unsigned char>(c) < 0x80)
                break;
            std::size_t next = pos;
            const UChar32 code_point = next_code_point(text, next);
            if (code_point < 0 || !u_isdigit(code_point))
                break;
            out.push_back(static_cast<char>('0' + u_charDigitValue(code_point)));
            pos = next;
            ++taken;
        }
        return taken;
    }
}

namespace numsort
{
    std::string decode_utf8_lossy(const std::string &bytes)
    {
        std::string text;
        text.reserve(bytes.size());
        std::size_t dropped = 0;
        std::size_t pos = 0;
        while (pos < bytes.size())
        {
            if (static_cast<unsigned char>(bytes[pos]) < 0x80)
            {
                text.push_back(bytes[pos++]);
                continue;
            }
            const std::size_t start = pos;
            if (next_code_point(bytes, pos) < 0)
                ++dropped;
            else
                text.append(bytes, start, pos - start);
        }
        if (dropped)
            spdlog::warn("Dropped {} invalid UTF-8 sequence(s) from the input", dropped);
        return text;
    }

    NumericValue parse_token(const std::string &token)
    {
        if (token.find('.') != std::string::npos)
            return NumericValue::real(std::strtod(token.c_str(), nullptr));
        return NumericValue::integer(DecimalInteger::parse(token));
    }

    /**
     * left to right scan for [+-]?\d+(\.\d+)? with the leftmost-longest rule of a regex
     * search: a sign without digits is skipped, a '.' is only taken when digits follow it,
     * and scanning resumes right after each token. One pass, no backtracking.
     */
    NumberSequence extract_numbers(const std::string &text)
    {
        NumberSequence numbers;
        std::size_t pos = 0;
        while (pos < text.size())
        {
            std::size_t cursor = pos;
            std::string token;
            if (text[cursor] == '+' || text[cursor] == '-')
                token.push_back(text[cursor++]);
            if (take_digits(text, cursor, token) == 0)
            {
                // no number starts here, move on by one character
                next_code_point(text, pos);
                continue;
            }
            if (cursor < text.size() && text[cursor] == '.')
            {
                std::size_t after_dot = cursor + 1;
                std::string fraction{"."};
                if (take_digits(text, after_dot, fraction) > 0)
                {
                    token += fraction;
                    cursor = after_dot;
                }
            }
            numbers.push_back(parse_token(token));
            pos = cursor;
        }
        return numbers;
    }

    NumberSequence read_numbers(const std::filesystem::path &path)
    {
        spdlog::info("==> PHASE: 1 -> Reading {} .....", path.string());
        const std::string bytes = common::read_file_bytes(path);
        spdlog::debug("Read {} bytes", bytes.size());
        NumberSequence numbers = extract_numbers(decode_utf8_lossy(bytes));
        spdlog::info("Total INPUT quantity: {}", numbers.size());
        return numbers;
    }
}
