#include "linexform/core/line_transforms.hpp"
#include <algorithm>
#include <utility>

namespace linexform {

namespace {

auto ascii_upper(char c) -> char {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

auto ascii_lower(char c) -> char {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

// Registration order is the order shown in --help
auto registry() -> const std::vector<std::pair<std::string, LineTransform>>& {
    static const std::vector<std::pair<std::string, LineTransform>> transforms = {
        {"upper", to_upper},
        {"lower", to_lower},
        {"trim", trim},
        {"identity", identity},
    };
    return transforms;
}

} // namespace

auto to_upper(const std::string& line) -> std::string {
    std::string result = line;
    std::transform(result.begin(), result.end(), result.begin(), ascii_upper);
    return result;
}

auto to_lower(const std::string& line) -> std::string {
    std::string result = line;
    std::transform(result.begin(), result.end(), result.begin(), ascii_lower);
    return result;
}

auto trim(const std::string& line) -> std::string {
    auto first = line.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    auto last = line.find_last_not_of(" \t");
    return line.substr(first, last - first + 1);
}

auto identity(const std::string& line) -> std::string { return line; }

auto find_line_transform(const std::string& name) -> std::optional<LineTransform> {
    const auto& transforms = registry();
    auto it = std::find_if(transforms.begin(), transforms.end(),
                           [&name](const auto& entry) { return entry.first == name; });
    if (it == transforms.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto line_transform_names() -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& entry : registry()) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace linexform
