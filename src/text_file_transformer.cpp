#include "linexform/text_file_transformer.hpp"
#include "linexform/core/errors.hpp"
#include "linexform/core/line_reader.hpp"
#include "linexform/core/preconditions.hpp"
#include "linexform/io/file_system.hpp"
#include <string>
#include <utility>

namespace linexform {

TextFileTransformer::TextFileTransformer(LineTransform line_transform)
    : TextFileTransformer(std::move(line_transform), std::make_shared<FileSystem>()) {}

TextFileTransformer::TextFileTransformer(LineTransform line_transform,
                                         std::shared_ptr<IFileSystem> file_system)
    : line_transform_(std::move(line_transform)), file_system_(std::move(file_system)) {}

auto TextFileTransformer::transform(const std::filesystem::path& source,
                                    const std::filesystem::path& destination) const -> void {
    check_argument(file_system_->is_regular_file(source), "Source must be regular file.");
    check_argument(file_system_->is_readable(source), "Source must be readable file.");
    check_argument(!file_system_->is_directory(destination), "Destination cannot be directory.");

    // Streams are owned here and closed by their destructors on every exit
    auto input = file_system_->open_read(source);
    auto output = file_system_->open_write(destination);

    std::string line;
    while (read_line(*input, line)) {
        *output << line_transform_(line) << '\n';
        if (!*output) {
            throw IoError("Cannot write file", destination);
        }
    }

    if (input->bad()) {
        throw IoError("Cannot read file", source);
    }
    if (!output->flush()) {
        throw IoError("Cannot write file", destination);
    }
}

} // namespace linexform
