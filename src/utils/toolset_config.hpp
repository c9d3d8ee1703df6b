#ifndef TOOLSET_CONFIG_HPP
#define TOOLSET_CONFIG_HPP

#include <optional>
#include <string>

namespace tfb_toolset {

enum class ListingMode {
    None,
    Frameworks,
    Tests,
    TestsWithTag,
    TestsForFramework,
};

struct ToolsetConfig {
    // Name listing to print instead of preparing a run
    ListingMode listing = ListingMode::None;

    // Tag or framework name for the listings that take one
    std::string listing_argument;

    // Suppress console echo; transcripts are still written
    bool quiet = false;

    // Optional: diagnostic log path (default: tfb-toolset.log)
    std::optional<std::string> log_file;
};

} // namespace tfb_toolset

#endif // TOOLSET_CONFIG_HPP
