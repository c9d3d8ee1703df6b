#ifndef NAME_PRINTER_HPP
#define NAME_PRINTER_HPP

#include "metadata/metadata.hpp"
#include "utils/toolset_error.hpp"
#include <iostream>
#include <string>

namespace tfb_toolset {

// Print the name of every listed entity on its own line of standard out,
// unstyled and without a transcript. A failed listing is passed on as is.
template <typename T>
bool printNames(const ListResult<T>& result, ToolsetError& error) {
    if (!result.success) {
        error = result.error;
        return false;
    }

    for (const auto& item : result.items) {
        std::cout << item.getName() << "\n";
    }
    return true;
}

class NamePrinter {
public:
    static bool printAllFrameworks(const Metadata& metadata, ToolsetError& error);
    static bool printAllTests(const Metadata& metadata, ToolsetError& error);
    static bool printAllTestsWithTag(const Metadata& metadata, const std::string& tag,
                                     ToolsetError& error);
    static bool printAllTestsForFramework(const Metadata& metadata, const std::string& framework,
                                          ToolsetError& error);
};

} // namespace tfb_toolset

#endif // NAME_PRINTER_HPP
