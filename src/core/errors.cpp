#include "linexform/core/errors.hpp"
#include <utility>

namespace linexform {

IoError::IoError(const std::string& message, std::filesystem::path path)
    : std::runtime_error(message + ": " + path.string()), path_(std::move(path)) {}

} // namespace linexform
