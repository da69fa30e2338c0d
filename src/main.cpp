#include "linexform/application/linexform_app.hpp"
#include "linexform/io/file_system.hpp"
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    try {
        auto config = linexform::parse_args(std::vector<std::string>(argv + 1, argv + argc));
        if (config.show_help) {
            std::cout << linexform::usage();
            return 0;
        }

        linexform::LinexformApp app(std::make_shared<linexform::FileSystem>());
        return app.run(config);
    } catch (const linexform::UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << linexform::usage();
        return static_cast<int>(linexform::ExitCode::USAGE_ERROR);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return static_cast<int>(linexform::ExitCode::RUNTIME_ERROR);
    }
}
