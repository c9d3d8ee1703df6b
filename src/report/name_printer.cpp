#include "report/name_printer.hpp"

namespace tfb_toolset {

bool NamePrinter::printAllFrameworks(const Metadata& metadata, ToolsetError& error) {
    return printNames(metadata.listAllFrameworks(), error);
}

bool NamePrinter::printAllTests(const Metadata& metadata, ToolsetError& error) {
    return printNames(metadata.listAllTests(), error);
}

bool NamePrinter::printAllTestsWithTag(const Metadata& metadata, const std::string& tag,
                                       ToolsetError& error) {
    return printNames(metadata.listTestsByTag(tag), error);
}

bool NamePrinter::printAllTestsForFramework(const Metadata& metadata, const std::string& framework,
                                            ToolsetError& error) {
    return printNames(metadata.listTestsForFramework(framework), error);
}

} // namespace tfb_toolset
