#include "utils/logger.hpp"
#include "utils/ansi.hpp"
#include "utils/diagnostic_log.hpp"
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

namespace tfb_toolset {

namespace fs = std::filesystem;

namespace {

constexpr const char* kWhitespace = " \t\r\n\f\v";

std::string_view trimEnd(std::string_view s) {
    size_t end = s.find_last_not_of(kWhitespace);
    return (end != std::string_view::npos) ? s.substr(0, end + 1) : std::string_view();
}

bool isBlank(std::string_view s) {
    return s.find_first_not_of(kWhitespace) == std::string_view::npos;
}

} // namespace

const char* toString(ScopeStatus status) {
    switch (status) {
        case ScopeStatus::Applied: return "applied";
        case ScopeStatus::SkippedNoLogDir: return "skipped: no log directory";
        case ScopeStatus::SkippedCreateFailed: return "skipped: create failed";
    }
    return "unknown";
}

Logger::Logger(std::optional<std::string> prefix,
               std::optional<fs::path> log_dir)
    : prefix_(std::move(prefix)), log_dir_(std::move(log_dir)) {
}

Logger Logger::withPrefix(const std::string& prefix) {
    return Logger(prefix, std::nullopt);
}

Logger Logger::inDir(const fs::path& log_dir) {
    return Logger(std::nullopt, log_dir);
}

Logger Logger::derive() const {
    Logger child(prefix_, log_dir_);
    child.quiet_ = quiet_;
    return child;
}

ScopeStatus Logger::scopeToTest(const std::string& test_name) {
    ScopeStatus status = ScopeStatus::SkippedNoLogDir;

    if (log_dir_) {
        fs::path test_dir = *log_dir_ / test_name;
        std::error_code ec;
        if (!fs::exists(test_dir, ec) && !ec) {
            fs::create_directories(test_dir, ec);
        }

        if (ec) {
            DiagnosticLog::warn(fmt::format("Cannot create log directory {}: {}",
                                            test_dir.string(), ec.message()));
            status = ScopeStatus::SkippedCreateFailed;
        } else {
            log_dir_ = test_dir;
            status = ScopeStatus::Applied;
        }
    }

    prefix_ = test_name;
    return status;
}

ScopeStatus Logger::bindFile(const std::string& file_name) {
    if (!log_dir_) {
        DiagnosticLog::debug(fmt::format("No log directory, {} not bound", file_name));
        return ScopeStatus::SkippedNoLogDir;
    }

    fs::path log_file = *log_dir_ / file_name;
    std::error_code ec;
    if (fs::exists(log_file, ec) && !fs::is_regular_file(log_file, ec)) {
        DiagnosticLog::warn("Log file path is not a regular file: " + log_file.string());
        return ScopeStatus::SkippedCreateFailed;
    }

    // Creates the file if needed and proves it writable; append mode never truncates
    std::ofstream file(log_file, std::ios::app);
    if (!file.is_open()) {
        DiagnosticLog::warn("Cannot open log file " + log_file.string());
        return ScopeStatus::SkippedCreateFailed;
    }

    log_file_ = log_file;
    return ScopeStatus::Applied;
}

bool Logger::writeLine(std::string_view text, ToolsetError& error) const {
    return writeLines(text, nullptr, error);
}

bool Logger::writeError(std::string_view text, ToolsetError& error) const {
    return writeLines(text, &style::kError, error);
}

bool Logger::writeLines(std::string_view text, const fmt::text_style* console_style,
                        ToolsetError& error) const {
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view line = text.substr(start, end - start);
        start = end + 1;

        if (isBlank(line)) {
            continue;
        }
        line = trimEnd(line);

        if (log_file_ && !appendToFile(line, error)) {
            return false;
        }

        if (!quiet_) {
            if (prefix_) {
                std::cout << stylize(*prefix_, style::kPrefix) << ": ";
            }
            if (console_style) {
                std::cout << stylize(line, *console_style) << "\n";
            } else {
                std::cout << line << "\n";
            }
        }
    }

    return true;
}

bool Logger::appendToFile(std::string_view line, ToolsetError& error) const {
    std::ofstream file(*log_file_, std::ios::app | std::ios::binary);
    if (!file.is_open()) {
        error = ToolsetError::io("Failed to open log file: " + log_file_->string());
        return false;
    }

    file << stripAnsi(line) << '\n';
    file.flush();

    if (!file.good()) {
        error = ToolsetError::io("Failed to write log file: " + log_file_->string());
        return false;
    }

    return true;
}

} // namespace tfb_toolset
