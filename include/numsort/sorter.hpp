#pragma once
#include "numeric_value.hpp"

#include <cstddef>

namespace numsort
{
    /**
     * @struct SortStats: counters collected by one bubble_sort() call
     * @param passes : passes over the unsorted prefix that were started
     * @param comparisons : adjacent pairs compared
     * @param swaps : adjacent pairs exchanged
     */
    struct SortStats
    {
        std::size_t passes{0};
        std::size_t comparisons{0};
        std::size_t swaps{0};
    };

    /**
     * in-place, ascending, stable bubble sort.
     * every pass bubbles the largest remaining value to the end of the unsorted prefix,
     * a pass without swaps stops the sort.
     * Average/Worst: O(n^2). Best (already sorted): O(n), one pass and zero swaps.
     */
    SortStats bubble_sort(NumberSequence &sequence);

    // true when no element is greater than its successor
    bool is_non_decreasing(const NumberSequence &sequence);
}
