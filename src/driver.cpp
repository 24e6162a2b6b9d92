/**
 * @file driver.cpp
 * Project: numsort, bubble sort over the numbers found in a text file
 * You are free to use, modify, and distribute this code for educational purposes.
 */
#include "numsort/driver.hpp"
#include "numsort/common.hpp"
#include "numsort/constants.hpp"
#include "numsort/extractor.hpp"
#include "numsort/formatter.hpp"
#include "numsort/sorter.hpp"
#include "timer.hpp"
#include "spdlog/spdlog.h"

#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace numsort
{
    Options parse_cli(int argc, char **argv)
    {
        Options options;
        if (argc < 2)
        {
            spdlog::info("No input path provided, using {}", DEFAULT_INPUT);
            options.input = DEFAULT_INPUT;
            return options;
        }
        if (argc > 2)
            spdlog::warn("Program accepts 1 parameter, ignoring {} extra argument(s)", argc - 2);
        options.input = argv[1];
        // an empty argument names the working directory
        if (options.input.empty())
            options.input = ".";
        return options;
    }

    fs::path output_path_for(const fs::path &input)
    {
        fs::path output = input;
        output.replace_extension(OUTPUT_SUFFIX);
        return output;
    }

    int run(const Options &options, std::ostream &out, Report &report)
    {
        const fs::path &input = options.input;
        report.INPUT = input.string();

        std::error_code error_code;
        if (!fs::is_regular_file(input, error_code))
        {
            const fs::path absolute = common::resolve_absolute(input);
            spdlog::error("==> X => INPUT is not a regular file: {}", absolute.string());
            out << MSG_NOT_FOUND << absolute.string() << '\n';
            return EXIT_INPUT_NOT_FOUND;
        }

        NumberSequence numbers;
        {
            PhaseTimer timer(report.READ_TIME);
            numbers = read_numbers(input);
        }
        report.VALUES = numbers.size();
        if (numbers.empty())
        {
            spdlog::warn("No numeric tokens in {}", input.string());
            out << MSG_NO_NUMBERS << '\n';
            return EXIT_OK;
        }

        spdlog::info("==> PHASE: 2 -> Starting bubble sort on {} values.....", numbers.size());
        SortStats stats;
        {
            PhaseTimer timer(report.SORT_TIME);
            stats = bubble_sort(numbers);
        }
        report.PASSES = stats.passes;
        report.SWAPS = stats.swaps;
        spdlog::debug("passes={} comparisons={} swaps={}", stats.passes, stats.comparisons, stats.swaps);
        if (!is_non_decreasing(numbers))
            throw std::logic_error("bubble sort left the sequence unordered");

        const std::string line = join_values(numbers);
        out << MSG_HEADER << '\n'
            << line << '\n';

        spdlog::info("==> PHASE: 3 -> Writing results ....");
        const fs::path output = output_path_for(input);
        {
            PhaseTimer timer(report.WRITE_TIME);
            common::write_text_file(output, line);
        }
        const fs::path absolute_output = common::resolve_absolute(output);
        report.OUTPUT = absolute_output.string();
        out << MSG_WRITTEN << report.OUTPUT << '\n';

        spdlog::info("IN: {} | OUT: {} | V: {} | P: {} | S: {} | RT: {} | ST: {} | WT: {}",
                     report.INPUT, report.OUTPUT, report.VALUES, report.PASSES, report.SWAPS,
                     report.READ_TIME, report.SORT_TIME, report.WRITE_TIME);
        return EXIT_OK;
    }

    int run(const Options &options, std::ostream &out)
    {
        Report report;
        return run(options, out, report);
    }
}
