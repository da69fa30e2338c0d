#include "linexform/io/file_system.hpp"
#include "linexform/core/errors.hpp"
#include <fstream>
#include <system_error>
#include <unistd.h>

namespace linexform {

auto FileSystem::is_regular_file(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

auto FileSystem::is_readable(const std::filesystem::path& path) -> bool {
    return ::access(path.c_str(), R_OK) == 0;
}

auto FileSystem::is_directory(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

auto FileSystem::open_read(const std::filesystem::path& path) -> std::unique_ptr<std::istream> {
    // Binary mode: line terminators are handled by read_line, not the library
    auto file = std::make_unique<std::ifstream>(path, std::ios::in | std::ios::binary);
    if (!file->is_open()) {
        throw IoError("Cannot open file for reading", path);
    }
    return file;
}

auto FileSystem::open_write(const std::filesystem::path& path) -> std::unique_ptr<std::ostream> {
    auto file = std::make_unique<std::ofstream>(
        path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file->is_open()) {
        throw IoError("Cannot open file for writing", path);
    }
    return file;
}

} // namespace linexform
