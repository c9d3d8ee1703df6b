#include "env/tfb_paths.hpp"
#include "utils/diagnostic_log.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <ctime>
#include <system_error>

namespace tfb_toolset {

namespace fs = std::filesystem;

std::optional<fs::path> TfbPaths::getTfbDir(const Environment& environment, ToolsetError& error) {
    fs::path tfb_path;
    std::error_code ec;

    if (auto tfb_home = environment.getVariable(kHomeVariable)) {
        tfb_path = *tfb_home;
    } else if (auto home_dir = environment.homeDirectory()) {
        tfb_path = *home_dir / kHomeSubdirectory;
        if (!fs::exists(tfb_path, ec)) {
            if (auto current_dir = environment.currentDirectory()) {
                tfb_path = *current_dir;
            }
        }
    } else if (auto current_dir = environment.currentDirectory()) {
        tfb_path = *current_dir;
    }

    if (tfb_path.empty() || !fs::is_directory(tfb_path / kFrameworksDirectory, ec)) {
        error = ToolsetError::invalidFrameworkBenchmarksDir(tfb_path.string());
        return std::nullopt;
    }

    DiagnosticLog::info("FrameworkBenchmarks directory: " + tfb_path.string());
    return tfb_path;
}

std::string TfbPaths::formatTimestamp(std::chrono::system_clock::time_point time) {
    std::tm utc = fmt::gmtime(std::chrono::system_clock::to_time_t(time));
    return fmt::format("{:%Y%m%d%H%M%S}", utc);
}

std::optional<fs::path> TfbPaths::createResultsDir(const fs::path& root,
                                                   std::chrono::system_clock::time_point now,
                                                   ToolsetError& error) {
    fs::path result_dir = root / kResultsDirectory / formatTimestamp(now);

    std::error_code ec;
    fs::create_directories(result_dir, ec);
    if (ec) {
        error = ToolsetError::io(fmt::format("Failed to create results directory {}: {}",
                                             result_dir.string(), ec.message()));
        return std::nullopt;
    }

    return result_dir;
}

} // namespace tfb_toolset
