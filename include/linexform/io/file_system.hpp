#pragma once

#include "linexform/interfaces.hpp"

namespace linexform {

// Concrete filesystem over std::filesystem, file streams and access(2)
class FileSystem : public IFileSystem {
public:
    auto is_regular_file(const std::filesystem::path& path) -> bool override;
    auto is_readable(const std::filesystem::path& path) -> bool override;
    auto is_directory(const std::filesystem::path& path) -> bool override;
    auto open_read(const std::filesystem::path& path) -> std::unique_ptr<std::istream> override;
    auto open_write(const std::filesystem::path& path) -> std::unique_ptr<std::ostream> override;
};

} // namespace linexform
