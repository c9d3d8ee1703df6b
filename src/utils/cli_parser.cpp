#include "utils/cli_parser.hpp"
#include "tfb_toolset/version.hpp"
#include <iostream>

namespace tfb_toolset {

bool CliParser::setListing(CliParseResult& result, ListingMode mode, const std::string& argument) {
    if (result.config.listing != ListingMode::None) {
        result.success = false;
        result.error_message = "Only one listing option may be given";
        return false;
    }
    result.config.listing = mode;
    result.config.listing_argument = argument;
    return true;
}

CliParseResult CliParser::parse(int argc, char* argv[]) {
    return parse(std::vector<std::string>(argv, argv + argc));
}

CliParseResult CliParser::parse(const std::vector<std::string>& args) {
    CliParseResult result;
    result.success = true;
    result.show_help = false;
    result.show_version = false;

    for (size_t i = 1; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            result.show_help = true;
            return result;
        }

        if (arg == "-v" || arg == "--version") {
            result.show_version = true;
            return result;
        }

        if (arg == "--quiet" || arg == "-q") {
            result.config.quiet = true;
            continue;
        }

        if (arg == "--list-frameworks") {
            if (!setListing(result, ListingMode::Frameworks, "")) {
                return result;
            }
            continue;
        }

        if (arg == "--list-tests") {
            if (!setListing(result, ListingMode::Tests, "")) {
                return result;
            }
            continue;
        }

        if (arg == "--list-tag" || arg == "--list-tests-for") {
            if (i + 1 >= args.size()) {
                result.success = false;
                result.error_message = "Missing value for " + arg;
                return result;
            }
            ListingMode mode = (arg == "--list-tag") ? ListingMode::TestsWithTag
                                                     : ListingMode::TestsForFramework;
            if (!setListing(result, mode, args[++i])) {
                return result;
            }
            continue;
        }

        if (arg == "--log-file" || arg == "-l") {
            if (i + 1 >= args.size()) {
                result.success = false;
                result.error_message = "Missing value for --log-file";
                return result;
            }
            result.config.log_file = args[++i];
            continue;
        }

        if (!arg.empty() && arg[0] == '-') {
            result.success = false;
            result.error_message = "Unknown option: " + arg;
            return result;
        }

        result.success = false;
        result.error_message = "Unexpected argument: " + arg;
        return result;
    }

    return result;
}

void CliParser::printUsage(const std::string& program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "FrameworkBenchmarks toolset - prepares run results and lists frameworks and tests\n"
              << "\n"
              << "Options:\n"
              << "  --list-frameworks          Print the name of every framework\n"
              << "  --list-tests               Print the name of every test\n"
              << "  --list-tag TAG             Print the tests carrying TAG\n"
              << "  --list-tests-for NAME      Print the tests of framework NAME\n"
              << "  -q, --quiet                Do not echo run output to the console\n"
              << "  -l, --log-file PATH        Diagnostic log path (default: tfb-toolset.log)\n"
              << "  -h, --help                 Show this help message\n"
              << "  -v, --version              Show version information\n"
              << "\n"
              << "Environment:\n"
              << "  TFB_HOME                   FrameworkBenchmarks directory (default: ~/.tfb, then\n"
              << "                             the working directory)\n"
              << "  SPDLOG_LEVEL               Diagnostic log level (e.g. debug)\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " --list-frameworks\n"
              << "  " << program_name << " --list-tag broken\n"
              << "  TFB_HOME=/srv/tfb " << program_name << " --list-tests-for gemini\n";
}

void CliParser::printVersion() {
    std::cout << PROGRAM_NAME << " version " << VERSION << "\n";
}

} // namespace tfb_toolset
