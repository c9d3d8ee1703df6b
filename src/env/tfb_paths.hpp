#ifndef TFB_PATHS_HPP
#define TFB_PATHS_HPP

#include "env/environment.hpp"
#include "utils/toolset_error.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace tfb_toolset {

class TfbPaths {
public:
    static constexpr const char* kHomeVariable = "TFB_HOME";
    static constexpr const char* kHomeSubdirectory = ".tfb";
    static constexpr const char* kFrameworksDirectory = "frameworks";
    static constexpr const char* kResultsDirectory = "results";

    // Locate the FrameworkBenchmarks root: $TFB_HOME, else ~/.tfb, else the
    // working directory when ~/.tfb does not exist. The root must contain
    // a "frameworks" directory.
    static std::optional<std::filesystem::path> getTfbDir(const Environment& environment,
                                                          ToolsetError& error);

    // "YYYYMMDDHHMMSS" in UTC
    static std::string formatTimestamp(std::chrono::system_clock::time_point time);

    // Create <root>/results/<timestamp> for this run
    static std::optional<std::filesystem::path> createResultsDir(
        const std::filesystem::path& root,
        std::chrono::system_clock::time_point now,
        ToolsetError& error);
};

} // namespace tfb_toolset

#endif // TFB_PATHS_HPP
