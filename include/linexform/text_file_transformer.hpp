#pragma once

#include "linexform/core/line_transforms.hpp"
#include "linexform/interfaces.hpp"
#include <filesystem>
#include <memory>

namespace linexform {

// Streams a text file line by line through a transformation into a destination
// file. Holds no state besides the transformation and the filesystem, so one
// instance may serve any number of calls.
class TextFileTransformer {
public:
    explicit TextFileTransformer(LineTransform line_transform);
    TextFileTransformer(LineTransform line_transform, std::shared_ptr<IFileSystem> file_system);

    // Writes line_transform(line) + "\n" for every source line, replacing any
    // existing destination content.
    //
    // Throws PreconditionError before opening anything when source is not a
    // readable regular file or destination is a directory, and IoError for
    // failures after that. Exceptions from the transformation propagate as-is.
    // Both files are closed on every path; nothing is rolled back.
    auto transform(const std::filesystem::path& source,
                   const std::filesystem::path& destination) const -> void;

private:
    const LineTransform line_transform_;
    const std::shared_ptr<IFileSystem> file_system_;
};

} // namespace linexform
