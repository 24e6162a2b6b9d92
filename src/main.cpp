#include "numsort/common.hpp"
#include "numsort/driver.hpp"
#include "spdlog/spdlog.h"

#include <cstdlib>
#include <exception>
#include <iostream>

int main(int argc, char **argv)
{
    try
    {
        numsort::common::init_logging();
        const numsort::Options options = numsort::parse_cli(argc, argv);
        return numsort::run(options, std::cout);
    }
    catch (const std::exception &error)
    {
        spdlog::error("==> X Operation aborted due to: {} X <==", error.what());
        return EXIT_FAILURE;
    }
}
