#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace linexform {

using LineTransform = std::function<std::string(const std::string&)>;

// Built-in transformations, ASCII only; other bytes pass through untouched
auto to_upper(const std::string& line) -> std::string;
auto to_lower(const std::string& line) -> std::string;
auto trim(const std::string& line) -> std::string;
auto identity(const std::string& line) -> std::string;

// Lookup by the names used on the command line
auto find_line_transform(const std::string& name) -> std::optional<LineTransform>;
auto line_transform_names() -> std::vector<std::string>;

} // namespace linexform
