#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace linexform {

// Invalid source or destination, raised before any stream is opened
class PreconditionError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Open, read or write failure once the preconditions have passed
class IoError : public std::runtime_error {
public:
    IoError(const std::string& message, std::filesystem::path path);

    auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace linexform
