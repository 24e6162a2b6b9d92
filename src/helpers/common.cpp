#include "numsort/common.hpp"
#include "numsort/constants.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

#ifndef NUMSORT_LOG_LEVEL
#define NUMSORT_LOG_LEVEL "warn"
#endif

namespace numsort::common
{
    /**
     * stdout carries the sorted numbers, so diagnostics are sent to stderr
     */
    void init_logging()
    {
        auto logger = spdlog::get(LOGGER_NAME);
        if (!logger)
            logger = spdlog::stderr_color_mt(LOGGER_NAME);
        logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        logger->set_level(spdlog::level::from_str(NUMSORT_LOG_LEVEL));
        spdlog::set_default_logger(logger);
    }

    std::string read_file_bytes(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            spdlog::error("==> X => Error in opening INPUT stream.....");
            throw std::runtime_error("cannot open input file: " + path.string());
        }
        std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad())
            throw std::runtime_error("Read stream error: " + path.string());
        return bytes;
    }

    void write_text_file(const std::filesystem::path &path, const std::string &text)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            spdlog::error("==> X => Error in opening OUTPUT stream.....");
            throw std::runtime_error("cannot open output file: " + path.string());
        }
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.close();
        if (!out)
            throw std::runtime_error("Write stream error: " + path.string());
    }

    std::filesystem::path resolve_absolute(const std::filesystem::path &path)
    {
        namespace fs = std::filesystem;
        std::error_code error_code;
        const fs::path absolute = fs::absolute(path, error_code);
        if (error_code)
        {
            spdlog::warn("Cannot make {} absolute: {}", path.string(), error_code.message());
            return path;
        }
        fs::path resolved = fs::weakly_canonical(absolute, error_code);
        if (error_code)
        {
            spdlog::warn("Cannot resolve {}: {}", absolute.string(), error_code.message());
            return absolute.lexically_normal();
        }
        return resolved;
    }
}
