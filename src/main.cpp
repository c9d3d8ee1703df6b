#include "utils/cli_parser.hpp"
#include "utils/diagnostic_log.hpp"
#include "utils/logger.hpp"
#include "utils/ansi.hpp"
#include "env/environment.hpp"
#include "env/tfb_paths.hpp"
#include "metadata/directory_metadata.hpp"
#include "report/name_printer.hpp"
#include <chrono>
#include <iostream>

using namespace tfb_toolset;

namespace {

void printError(const std::string& message) {
    const std::string line = "Error: " + message;
    std::cerr << stylize(line, style::kError) << "\n";
    DiagnosticLog::error(line);
}

bool printListing(const ToolsetConfig& config, const Metadata& metadata, ToolsetError& error) {
    switch (config.listing) {
        case ListingMode::Frameworks:
            return NamePrinter::printAllFrameworks(metadata, error);
        case ListingMode::Tests:
            return NamePrinter::printAllTests(metadata, error);
        case ListingMode::TestsWithTag:
            return NamePrinter::printAllTestsWithTag(metadata, config.listing_argument, error);
        case ListingMode::TestsForFramework:
            return NamePrinter::printAllTestsForFramework(metadata, config.listing_argument, error);
        case ListingMode::None:
            break;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    // Parse command line arguments first to get log file path
    auto parse_result = CliParser::parse(argc, argv);

    struct LoggerShutdownGuard {
        ~LoggerShutdownGuard() {
            DiagnosticLog::shutdown();
        }
    } logger_shutdown_guard;
    (void)logger_shutdown_guard;

    const std::string log_file_path = parse_result.config.log_file.value_or(
        DiagnosticLog::defaultLogFilePath());
    std::string logger_error;
    if (!DiagnosticLog::initialize(log_file_path, logger_error)) {
        std::cerr << "Warning: Failed to initialize log file '" << log_file_path
                  << "': " << logger_error << "\n";
    } else {
        std::string cmdline;
        for (int i = 0; i < argc; i++) {
            if (i > 0) cmdline += ' ';
            cmdline += argv[i];
        }
        DiagnosticLog::info("Command: " + cmdline);
    }

    if (!parse_result.success) {
        printError(parse_result.error_message);
        std::string help_hint = "Try '" + std::string(argv[0]) + " --help' for more information.";
        std::cerr << help_hint << "\n";
        DiagnosticLog::error(help_hint);
        return 1;
    }

    if (parse_result.show_help) {
        CliParser::printUsage(argv[0]);
        return 0;
    }

    if (parse_result.show_version) {
        CliParser::printVersion();
        return 0;
    }

    const ToolsetConfig& config = parse_result.config;
    auto environment = Environment::create();

    ToolsetError error;
    auto tfb_dir = TfbPaths::getTfbDir(*environment, error);
    if (!tfb_dir) {
        printError(error.message);
        return 1;
    }

    if (config.listing != ListingMode::None) {
        DirectoryMetadata metadata(*tfb_dir);
        if (!printListing(config, metadata, error)) {
            printError(error.message);
            return 1;
        }
        return 0;
    }

    // Only prepares the run; benchmark execution and the verification summary happen elsewhere.
    // Results are kept relative to where the toolset is run from
    auto run_root = environment->currentDirectory().value_or(".");
    auto results_dir = TfbPaths::createResultsDir(run_root, std::chrono::system_clock::now(), error);
    if (!results_dir) {
        printError(error.message);
        return 1;
    }

    Logger logger = Logger::inDir(*results_dir);
    logger.setQuiet(config.quiet);
    if (!logger.writeLine(stylize("Results directory: " + results_dir->string(), style::kStructure), error)) {
        printError(error.message);
        return 1;
    }

    return 0;
}
