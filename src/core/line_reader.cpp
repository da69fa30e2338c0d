#include "linexform/core/line_reader.hpp"

namespace linexform {

auto read_line(std::istream& input, std::string& line) -> bool {
    using traits = std::istream::traits_type;

    line.clear();
    bool read_any = false;

    for (auto c = input.get(); c != traits::eof(); c = input.get()) {
        read_any = true;
        if (c == '\n') {
            return true;
        }
        if (c == '\r') {
            if (input.peek() == '\n') {
                input.get();
            }
            return true;
        }
        line.push_back(traits::to_char_type(c));
    }

    if (input.bad()) {
        return false;
    }
    return read_any;
}

} // namespace linexform
