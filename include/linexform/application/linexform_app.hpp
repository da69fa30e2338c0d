#pragma once

#include "linexform/interfaces.hpp"
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace linexform {

struct Config {
    std::filesystem::path source;
    std::filesystem::path destination;
    std::string transform_name = "upper";
    bool quiet = false;
    bool show_help = false;
};

// Bad command line: unknown option, missing value or wrong argument count
class UsageError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Arguments exclude the program name
auto parse_args(const std::vector<std::string>& args) -> Config;

auto usage() -> std::string;

enum class ExitCode : int {
    SUCCESS = 0,
    RUNTIME_ERROR = 1, // I/O failure or a throwing transformation
    USAGE_ERROR = 2    // Bad command line or failed precondition
};

class LinexformApp {
private:
    std::shared_ptr<IFileSystem> filesystem_;

public:
    explicit LinexformApp(std::shared_ptr<IFileSystem> filesystem);

    // Reports on std::cout / std::cerr and returns an ExitCode
    auto run(const Config& config) -> int;
};

} // namespace linexform
