#ifndef DIRECTORY_METADATA_HPP
#define DIRECTORY_METADATA_HPP

#include "metadata/metadata.hpp"
#include <filesystem>

namespace tfb_toolset {

// Metadata read from the FrameworkBenchmarks directory layout
// (frameworks/<Language>/<Framework>/benchmark_config.json).
// Config files are not parsed: each framework yields its default test,
// named after the framework, and tests carry no tags.
class DirectoryMetadata : public Metadata {
public:
    static constexpr const char* kConfigFileName = "benchmark_config.json";

    explicit DirectoryMetadata(std::filesystem::path tfb_dir);

    ListResult<Framework> listAllFrameworks() const override;
    ListResult<Test> listAllTests() const override;
    ListResult<Test> listTestsByTag(const std::string& tag) const override;
    ListResult<Test> listTestsForFramework(const std::string& framework) const override;

private:
    std::filesystem::path tfb_dir_;
};

} // namespace tfb_toolset

#endif // DIRECTORY_METADATA_HPP
