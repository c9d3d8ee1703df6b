#include "utils/diagnostic_log.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <mutex>

namespace tfb_toolset {
namespace {

constexpr const char* kLoggerName = "tfb_toolset";
constexpr const char* kPattern = "%Y-%m-%d %H:%M:%S.%e [%l] %v";

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;

std::shared_ptr<spdlog::logger> getLogger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    return g_logger;
}

void logAt(spdlog::level::level_enum level, std::string_view message) {
    auto logger = getLogger();
    if (!logger) {
        return;
    }
    logger->log(level, "{}", message);
}

} // namespace

std::string DiagnosticLog::defaultLogFilePath() {
    return "tfb-toolset.log";
}

bool DiagnosticLog::initialize(const std::string& log_file_path, std::string& error_message) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);

    if (g_logger) {
        return true;
    }

    try {
        // SPDLOG_LEVEL=debug (or "tfb_toolset=debug") raises verbosity
        spdlog::cfg::load_env_levels();

        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_path, true);
        g_logger = std::make_shared<spdlog::logger>(kLoggerName, file_sink);
        spdlog::initialize_logger(g_logger);
        g_logger->set_pattern(kPattern);
        g_logger->flush_on(spdlog::level::info);
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        error_message = ex.what();
        if (g_logger) {
            spdlog::drop(kLoggerName);
        }
        g_logger.reset();
        return false;
    }
}

bool DiagnosticLog::isInitialized() {
    return getLogger() != nullptr;
}

void DiagnosticLog::debug(std::string_view message) {
    logAt(spdlog::level::debug, message);
}

void DiagnosticLog::info(std::string_view message) {
    logAt(spdlog::level::info, message);
}

void DiagnosticLog::warn(std::string_view message) {
    logAt(spdlog::level::warn, message);
}

void DiagnosticLog::error(std::string_view message) {
    logAt(spdlog::level::err, message);
}

void DiagnosticLog::shutdown() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);

    if (!g_logger) {
        return;
    }

    g_logger->flush();
    spdlog::drop(kLoggerName);
    g_logger.reset();
}

} // namespace tfb_toolset
