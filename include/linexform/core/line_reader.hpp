#pragma once

#include <istream>
#include <string>

namespace linexform {

// Read the next line without its terminator. "\n", "\r\n" and a lone "\r" all
// end a line; a trailing line without a terminator is still returned.
// Returns false at end of input or once the stream has gone bad.
auto read_line(std::istream& input, std::string& line) -> bool;

} // namespace linexform
