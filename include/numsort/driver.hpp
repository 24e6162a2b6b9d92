#pragma once
#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>

namespace numsort
{
    /**
     * @struct Options: everything the command line can set
     * @param input : path given as first argument, DEFAULT_INPUT otherwise
     */
    struct Options
    {
        std::filesystem::path input;
    };

    /**
     * @struct Report: summary of one run, logged as a single line at the end
     */
    struct Report
    {
        std::string INPUT;
        std::string OUTPUT;
        std::size_t VALUES{0};
        std::size_t PASSES{0};
        std::size_t SWAPS{0};
        std::string READ_TIME;
        std::string SORT_TIME;
        std::string WRITE_TIME;
    };

    /**
     * -------------- CLI and path processors --------------
     */
    Options parse_cli(int argc, char **argv);
    // input with its final extension replaced by OUTPUT_SUFFIX
    std::filesystem::path output_path_for(const std::filesystem::path &input);

    /**
     * runs read -> sort -> format -> write, user visible lines go to out.
     * @return EXIT_OK on success or when no numbers were found, EXIT_INPUT_NOT_FOUND when
     * the input is missing or not a regular file. I/O failures are thrown.
     */
    int run(const Options &options, std::ostream &out, Report &report);
    int run(const Options &options, std::ostream &out);
}
