#include "linexform/io/memory_file_system.hpp"
#include "linexform/core/errors.hpp"
#include "linexform/core/line_reader.hpp"
#include <algorithm>
#include <sstream>
#include <streambuf>
#include <utility>

namespace linexform {

namespace {

// Appends straight into the stored file content, failing once the byte
// limit is reached
class ContentWriteBuffer : public std::streambuf {
public:
    ContentWriteBuffer(std::shared_ptr<std::string> content, std::optional<std::size_t> capacity)
        : content_(std::move(content)), capacity_(capacity) {}

protected:
    auto overflow(int_type ch) -> int_type override {
        if (traits_type::eq_int_type(ch, traits_type::eof())) {
            return traits_type::not_eof(ch);
        }
        if (remaining() == 0) {
            return traits_type::eof();
        }
        content_->push_back(traits_type::to_char_type(ch));
        return ch;
    }

    auto xsputn(const char_type* s, std::streamsize count) -> std::streamsize override {
        auto accepted = std::min(static_cast<std::size_t>(count), remaining());
        content_->append(s, accepted);
        return static_cast<std::streamsize>(accepted);
    }

private:
    auto remaining() const -> std::size_t {
        if (!capacity_) {
            return content_->max_size() - content_->size();
        }
        return content_->size() >= *capacity_ ? 0 : *capacity_ - content_->size();
    }

    std::shared_ptr<std::string> content_;
    std::optional<std::size_t> capacity_;
};

class ContentWriteStream : public std::ostream {
public:
    ContentWriteStream(std::shared_ptr<std::string> content, std::optional<std::size_t> capacity)
        : std::ostream(nullptr), buffer_(std::move(content), capacity) {
        rdbuf(&buffer_);
    }

private:
    ContentWriteBuffer buffer_;
};

} // namespace

MemoryFileSystem::MemoryFileSystem() { nodes_["/"] = Node{.directory = true}; }

auto MemoryFileSystem::is_regular_file(const std::filesystem::path& path) -> bool {
    const auto* node = find_node(path);
    return node != nullptr && !node->directory;
}

auto MemoryFileSystem::is_readable(const std::filesystem::path& path) -> bool {
    const auto* node = find_node(path);
    return node != nullptr && node->readable;
}

auto MemoryFileSystem::is_directory(const std::filesystem::path& path) -> bool {
    const auto* node = find_node(path);
    return node != nullptr && node->directory;
}

auto MemoryFileSystem::open_read(const std::filesystem::path& path)
    -> std::unique_ptr<std::istream> {
    const auto* node = find_node(path);
    if (node == nullptr || node->directory || !node->readable) {
        throw IoError("Cannot open file for reading", path);
    }
    // Snapshot of the content at open time
    return std::make_unique<std::istringstream>(*node->content);
}

auto MemoryFileSystem::open_write(const std::filesystem::path& path)
    -> std::unique_ptr<std::ostream> {
    auto key = key_for(path);
    if (!is_directory(std::filesystem::path(key).parent_path())) {
        throw IoError("Cannot open file for writing", path);
    }

    auto& node = nodes_[key];
    if (node.directory) {
        throw IoError("Cannot open file for writing", path);
    }
    if (!node.content) {
        node.content = std::make_shared<std::string>();
    }
    node.content->clear();

    return std::make_unique<ContentWriteStream>(node.content, capacity_);
}

auto MemoryFileSystem::create_directory(const std::filesystem::path& path) -> void {
    auto key = key_for(path);
    if (!is_directory(std::filesystem::path(key).parent_path())) {
        throw IoError("Parent directory does not exist", path);
    }
    if (const auto* node = find_node(path); node != nullptr) {
        if (node->directory) {
            return;
        }
        throw IoError("File already exists", path);
    }
    nodes_[key] = Node{.directory = true};
}

auto MemoryFileSystem::write_lines(const std::filesystem::path& path,
                                   const std::vector<std::string>& lines) -> void {
    auto stream = open_write(path);
    for (const auto& line : lines) {
        *stream << line << '\n';
    }
    if (!stream->flush()) {
        throw IoError("Cannot write file", path);
    }
}

auto MemoryFileSystem::read_lines(const std::filesystem::path& path) -> std::vector<std::string> {
    auto stream = open_read(path);

    std::vector<std::string> lines;
    std::string line;
    while (read_line(*stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

auto MemoryFileSystem::read_content(const std::filesystem::path& path) const -> std::string {
    return *find_file(path).content;
}

auto MemoryFileSystem::exists(const std::filesystem::path& path) const -> bool {
    return find_node(path) != nullptr;
}

auto MemoryFileSystem::set_readable(const std::filesystem::path& path, bool readable) -> void {
    auto it = nodes_.find(key_for(path));
    if (it == nodes_.end()) {
        throw IoError("No such file", path);
    }
    it->second.readable = readable;
}

auto MemoryFileSystem::key_for(const std::filesystem::path& path) -> std::string {
    auto normal = (std::filesystem::path("/") / path).lexically_normal().generic_string();
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal;
}

auto MemoryFileSystem::find_node(const std::filesystem::path& path) const -> const Node* {
    auto it = nodes_.find(key_for(path));
    return it == nodes_.end() ? nullptr : &it->second;
}

auto MemoryFileSystem::find_file(const std::filesystem::path& path) const -> const Node& {
    const auto* node = find_node(path);
    if (node == nullptr || node->directory) {
        throw IoError("No such file", path);
    }
    return *node;
}

} // namespace linexform
