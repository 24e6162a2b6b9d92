#pragma once
#include <filesystem>
#include <string>

namespace numsort::common
{
    // installs the stderr logger as spdlog default, level from NUMSORT_LOG_LEVEL
    void init_logging();
    // whole file as raw bytes
    std::string read_file_bytes(const std::filesystem::path &path);
    // creates or truncates path and writes text verbatim
    void write_text_file(const std::filesystem::path &path, const std::string &text);
    // absolute path with existing symlinks resolved, like a non-strict realpath
    std::filesystem::path resolve_absolute(const std::filesystem::path &path);
}
