#ifndef DIAGNOSTIC_LOG_HPP
#define DIAGNOSTIC_LOG_HPP

#include <string>
#include <string_view>

namespace tfb_toolset {

// Process-wide log of the toolset's own behaviour, separate from the
// per-test transcripts written by Logger. Messages logged before
// initialize() (or after shutdown()) are dropped.
class DiagnosticLog {
public:
    static std::string defaultLogFilePath();
    static bool initialize(const std::string& log_file_path, std::string& error_message);
    static bool isInitialized();
    static void debug(std::string_view message);
    static void info(std::string_view message);
    static void warn(std::string_view message);
    static void error(std::string_view message);
    static void shutdown();

private:
    DiagnosticLog() = delete;
};

} // namespace tfb_toolset

#endif // DIAGNOSTIC_LOG_HPP
