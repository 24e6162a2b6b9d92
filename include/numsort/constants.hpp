#pragma once
#include <string>

/**
 * Constants:
 * @param DEFAULT_INPUT is the input file used when no path is given on the command line
 * @param OUTPUT_SUFFIX replaces the final extension of the input to build the output path
 * @param MSG_* are the user visible lines written to stdout
 */
namespace numsort
{
    const std::string DEFAULT_INPUT{"numbers.txt"};
    const std::string OUTPUT_SUFFIX{".sorted.txt"};
    const std::string LOGGER_NAME{"numsort"};

    const std::string MSG_NOT_FOUND{"Input file not found: "};
    const std::string MSG_NO_NUMBERS{"No numbers found in the file."};
    const std::string MSG_HEADER{"Sorted numbers:"};
    const std::string MSG_WRITTEN{"Written to: "};

    // exit statuses of the driver
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_INPUT_NOT_FOUND = 1;
}
