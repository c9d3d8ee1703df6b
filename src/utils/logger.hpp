#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "utils/toolset_error.hpp"
#include <fmt/color.h>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace tfb_toolset {

// Outcome of Logger::scopeToTest / Logger::bindFile. Skips leave the
// logger usable for console output; they are never errors.
enum class ScopeStatus {
    Applied,
    SkippedNoLogDir,
    SkippedCreateFailed,
};

const char* toString(ScopeStatus status);

// Writes lines to standard out and, once a file is bound, appends a copy
// with ANSI styling removed to that file (the transcript).
//
// A Logger owns its transcript file: it is move-only, and derive() is the
// way to hand logging to another unit of work. The derived logger starts
// without a bound file and must bind its own before it writes a transcript.
// No locking is done; a Logger must not be shared between threads.
class Logger {
public:
    Logger() = default;
    Logger(std::optional<std::string> prefix,
           std::optional<std::filesystem::path> log_dir);

    // Console-only logger printing "<prefix>: " before every line
    static Logger withPrefix(const std::string& prefix);

    // Logger rooted at log_dir; nothing is written there until a test is
    // scoped and a file bound
    static Logger inDir(const std::filesystem::path& log_dir);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) noexcept = default;
    Logger& operator=(Logger&&) noexcept = default;

    // Copy of prefix, directory and quiet flag without the bound file
    Logger derive() const;

    // Moves log_dir into log_dir/test_name (created if needed) and sets the
    // prefix to test_name. The prefix is set even when the directory is
    // skipped.
    //
    // Example: log_dir "results/20200619191252" and test "gemini" gives
    //          log_dir "results/20200619191252/gemini".
    ScopeStatus scopeToTest(const std::string& test_name);

    // Binds log_dir/file_name as the transcript, creating it empty if it
    // does not exist. Existing content is kept.
    ScopeStatus bindFile(const std::string& file_name);

    // Writes each non-blank line of text to both sinks
    bool writeLine(std::string_view text, ToolsetError& error) const;

    // Like writeLine, with the console copy rendered red
    bool writeError(std::string_view text, ToolsetError& error) const;

    const std::optional<std::string>& prefix() const { return prefix_; }
    const std::optional<std::filesystem::path>& logDir() const { return log_dir_; }
    const std::optional<std::filesystem::path>& logFile() const { return log_file_; }

    bool isQuiet() const { return quiet_; }
    void setQuiet(bool quiet) { quiet_ = quiet; }

private:
    bool writeLines(std::string_view text, const fmt::text_style* console_style,
                    ToolsetError& error) const;
    bool appendToFile(std::string_view line, ToolsetError& error) const;

    std::optional<std::string> prefix_;
    std::optional<std::filesystem::path> log_dir_;
    std::optional<std::filesystem::path> log_file_;
    bool quiet_ = false;
};

} // namespace tfb_toolset

#endif // LOGGER_HPP
