#pragma once

#include "linexform/interfaces.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace linexform {

// In-memory filesystem for tests. Paths are treated as absolute; "/" always
// exists. Not safe for concurrent use.
class MemoryFileSystem : public IFileSystem {
public:
    MemoryFileSystem();

    auto is_regular_file(const std::filesystem::path& path) -> bool override;
    auto is_readable(const std::filesystem::path& path) -> bool override;
    auto is_directory(const std::filesystem::path& path) -> bool override;
    auto open_read(const std::filesystem::path& path) -> std::unique_ptr<std::istream> override;
    auto open_write(const std::filesystem::path& path) -> std::unique_ptr<std::ostream> override;

    // Parent must already exist
    auto create_directory(const std::filesystem::path& path) -> void;

    // Each line is written followed by "\n"
    auto write_lines(const std::filesystem::path& path, const std::vector<std::string>& lines)
        -> void;
    auto read_lines(const std::filesystem::path& path) -> std::vector<std::string>;
    auto read_content(const std::filesystem::path& path) const -> std::string;

    auto exists(const std::filesystem::path& path) const -> bool;
    auto set_readable(const std::filesystem::path& path, bool readable) -> void;

    // Byte limit for each write stream opened afterwards; nullopt removes it
    auto set_capacity(std::optional<std::size_t> bytes) -> void { capacity_ = bytes; }

private:
    struct Node {
        bool directory = false;
        bool readable = true;
        std::shared_ptr<std::string> content;
    };

    static auto key_for(const std::filesystem::path& path) -> std::string;
    auto find_node(const std::filesystem::path& path) const -> const Node*;
    auto find_file(const std::filesystem::path& path) const -> const Node&;

    std::map<std::string, Node> nodes_;
    std::optional<std::size_t> capacity_;
};

} // namespace linexform
