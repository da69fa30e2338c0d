#pragma once

#include <filesystem>
#include <istream>
#include <memory>
#include <ostream>

namespace linexform {

// Abstract filesystem seam so the transformer can run against a fake filesystem
class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto is_regular_file(const std::filesystem::path& path) -> bool = 0;
    virtual auto is_readable(const std::filesystem::path& path) -> bool = 0;
    virtual auto is_directory(const std::filesystem::path& path) -> bool = 0;
    virtual auto open_read(const std::filesystem::path& path) -> std::unique_ptr<std::istream> = 0;
    virtual auto open_write(const std::filesystem::path& path) -> std::unique_ptr<std::ostream> = 0;
};

} // namespace linexform
