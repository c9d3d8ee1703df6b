#ifndef CLI_PARSER_HPP
#define CLI_PARSER_HPP

#include "utils/toolset_config.hpp"
#include <string>
#include <vector>

namespace tfb_toolset {

struct CliParseResult {
    bool success;
    bool show_help;
    bool show_version;
    ToolsetConfig config;
    std::string error_message;
};

class CliParser {
public:
    static CliParseResult parse(int argc, char* argv[]);
    static CliParseResult parse(const std::vector<std::string>& args);

    static void printUsage(const std::string& program_name);
    static void printVersion();

private:
    static bool setListing(CliParseResult& result, ListingMode mode, const std::string& argument);
};

} // namespace tfb_toolset

#endif // CLI_PARSER_HPP
