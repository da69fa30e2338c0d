#include "linexform/core/preconditions.hpp"
#include "linexform/core/errors.hpp"

namespace linexform {

auto check_argument(bool condition, const std::string& message) -> void {
    if (!condition) {
        throw PreconditionError(message);
    }
}

} // namespace linexform
