#pragma once

#include <string>

namespace linexform {

// Throws PreconditionError carrying message when condition is false
auto check_argument(bool condition, const std::string& message) -> void;

} // namespace linexform
