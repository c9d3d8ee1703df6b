#ifndef TOOLSET_ERROR_HPP
#define TOOLSET_ERROR_HPP

#include <string>

namespace tfb_toolset {

enum class ToolsetErrorKind {
    None,
    // The resolved FrameworkBenchmarks root has no "frameworks" directory
    InvalidFrameworkBenchmarksDir,
    // Filesystem open/create/write failure
    Io,
};

struct ToolsetError {
    ToolsetErrorKind kind = ToolsetErrorKind::None;
    std::string message;

    static ToolsetError invalidFrameworkBenchmarksDir(const std::string& root) {
        return {ToolsetErrorKind::InvalidFrameworkBenchmarksDir,
                "Invalid FrameworkBenchmarks directory: " + root};
    }

    static ToolsetError io(const std::string& message) {
        return {ToolsetErrorKind::Io, message};
    }
};

} // namespace tfb_toolset

#endif // TOOLSET_ERROR_HPP
