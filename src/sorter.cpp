#include "numsort/sorter.hpp"
#include "spdlog/spdlog.h"

#include <utility>

namespace numsort
{
    SortStats bubble_sort(NumberSequence &sequence)
    {
        SortStats stats;
        const std::size_t n = sequence.size();
        // after pass i the last i+1 positions hold their final values
        for (std::size_t pass = 0; pass + 1 < n; ++pass)
        {
            ++stats.passes;
            bool swapped = false;
            for (std::size_t j = 0; j + 1 < n - pass; ++j)
            {
                ++stats.comparisons;
                // strict: equal neighbours never move, which keeps the sort stable
                if (sequence[j] > sequence[j + 1])
                {
                    std::swap(sequence[j], sequence[j + 1]);
                    ++stats.swaps;
                    swapped = true;
                }
            }
            if (!swapped)
            {
                spdlog::debug("Pass {} made no swaps, sequence is ordered", stats.passes);
                break;
            }
        }
        return stats;
    }

    bool is_non_decreasing(const NumberSequence &sequence)
    {
        for (std::size_t i = 1; i < sequence.size(); ++i)
        {
            if (sequence[i - 1] > sequence[i])
            {
                spdlog::error("==X Order violated at index {} X==", i);
                return false;
            }
        }
        return true;
    }
}
