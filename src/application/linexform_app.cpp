#include "linexform/application/linexform_app.hpp"
#include "linexform/core/errors.hpp"
#include "linexform/core/line_transforms.hpp"
#include "linexform/text_file_transformer.hpp"
#include <cstddef>
#include <iostream>
#include <sstream>
#include <utility>

namespace linexform {

namespace {

auto exit_code(ExitCode code) -> int { return static_cast<int>(code); }

auto join(const std::vector<std::string>& items, const std::string& separator) -> std::string {
    std::string result;
    for (const auto& item : items) {
        if (!result.empty()) {
            result += separator;
        }
        result += item;
    }
    return result;
}

} // namespace

auto parse_args(const std::vector<std::string>& args) -> Config {
    Config config;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "-t" || arg == "--transform") {
            if (i + 1 >= args.size()) {
                throw UsageError("Missing value for " + arg);
            }
            config.transform_name = args[++i];
        } else if (arg == "-q" || arg == "--quiet") {
            config.quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            config.show_help = true;
            return config;
        } else if (arg.size() > 1 && arg.front() == '-') {
            throw UsageError("Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (!find_line_transform(config.transform_name)) {
        throw UsageError("Unknown transform: " + config.transform_name);
    }
    if (positional.size() != 2) {
        throw UsageError("Expected <source> and <destination>");
    }

    config.source = positional[0];
    config.destination = positional[1];
    return config;
}

auto usage() -> std::string {
    std::ostringstream out;
    out << "Usage: linexform [options] <source> <destination>\n";
    out << "  -t, --transform <name>  Line transformation (" << join(line_transform_names(), ", ")
        << "); default upper\n";
    out << "  -q, --quiet             Suppress the summary line\n";
    out << "  -h, --help              Show this help\n";
    out << "\nExamples:\n";
    out << "  linexform notes.txt NOTES.txt              # Upper-case every line\n";
    out << "  linexform -t trim raw.txt clean.txt        # Strip surrounding blanks\n";
    return out.str();
}

LinexformApp::LinexformApp(std::shared_ptr<IFileSystem> filesystem)
    : filesystem_(std::move(filesystem)) {}

auto LinexformApp::run(const Config& config) -> int {
    auto line_transform = find_line_transform(config.transform_name);
    if (!line_transform) {
        std::cerr << "Error: Unknown transform: " << config.transform_name << "\n";
        return exit_code(ExitCode::USAGE_ERROR);
    }

    // Count lines on the way through; the transformer itself reports nothing
    size_t line_count = 0;
    TextFileTransformer transformer(
        [&line_count, fn = *line_transform](const std::string& line) {
            ++line_count;
            return fn(line);
        },
        filesystem_);

    try {
        transformer.transform(config.source, config.destination);
    } catch (const PreconditionError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return exit_code(ExitCode::USAGE_ERROR);
    } catch (const IoError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return exit_code(ExitCode::RUNTIME_ERROR);
    } catch (const std::exception& e) {
        std::cerr << "Error: Transformation failed after " << line_count
                  << " lines: " << e.what() << "\n";
        return exit_code(ExitCode::RUNTIME_ERROR);
    }

    if (!config.quiet) {
        std::cout << "Transformed " << line_count << " lines from " << config.source.string()
                  << " to " << config.destination.string() << "\n";
    }
    return exit_code(ExitCode::SUCCESS);
}

} // namespace linexform
