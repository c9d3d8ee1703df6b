#include "metadata/directory_metadata.hpp"
#include "env/tfb_paths.hpp"
#include <algorithm>
#include <system_error>
#include <utility>

namespace tfb_toolset {

namespace fs = std::filesystem;

namespace {

std::vector<fs::path> sortedSubdirectories(const fs::path& dir, std::error_code& ec) {
    std::vector<fs::path> dirs;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            dirs.push_back(it->path());
        }
    }
    std::sort(dirs.begin(), dirs.end());
    return dirs;
}

Test defaultTest(const Framework& framework) {
    Test test;
    test.name = framework.name;
    test.framework_name = framework.name;
    return test;
}

} // namespace

DirectoryMetadata::DirectoryMetadata(fs::path tfb_dir)
    : tfb_dir_(std::move(tfb_dir)) {
}

ListResult<Framework> DirectoryMetadata::listAllFrameworks() const {
    ListResult<Framework> result;
    const fs::path frameworks_dir = tfb_dir_ / TfbPaths::kFrameworksDirectory;

    std::error_code ec;
    auto languages = sortedSubdirectories(frameworks_dir, ec);
    if (ec) {
        return ListResult<Framework>::failure(ToolsetError::io(
            "Failed to read " + frameworks_dir.string() + ": " + ec.message()));
    }

    for (const auto& language_dir : languages) {
        auto framework_dirs = sortedSubdirectories(language_dir, ec);
        if (ec) {
            return ListResult<Framework>::failure(ToolsetError::io(
                "Failed to read " + language_dir.string() + ": " + ec.message()));
        }

        for (const auto& framework_dir : framework_dirs) {
            std::error_code exists_ec;
            if (!fs::is_regular_file(framework_dir / kConfigFileName, exists_ec)) {
                continue;
            }
            result.items.push_back(Framework{framework_dir.filename().string(),
                                             language_dir.filename().string()});
        }
    }

    return result;
}

ListResult<Test> DirectoryMetadata::listAllTests() const {
    auto frameworks = listAllFrameworks();
    if (!frameworks.success) {
        return ListResult<Test>::failure(frameworks.error);
    }

    ListResult<Test> result;
    for (const auto& framework : frameworks.items) {
        result.items.push_back(defaultTest(framework));
    }
    return result;
}

ListResult<Test> DirectoryMetadata::listTestsByTag(const std::string& tag) const {
    auto result = listAllTests();
    if (!result.success) {
        return result;
    }

    auto& tests = result.items;
    tests.erase(std::remove_if(tests.begin(), tests.end(),
                               [&tag](const Test& test) { return !test.hasTag(tag); }),
                tests.end());
    return result;
}

ListResult<Test> DirectoryMetadata::listTestsForFramework(const std::string& framework) const {
    auto result = listAllTests();
    if (!result.success) {
        return result;
    }

    auto& tests = result.items;
    tests.erase(std::remove_if(tests.begin(), tests.end(),
                               [&framework](const Test& test) { return test.framework_name != framework; }),
                tests.end());
    return result;
}

} // namespace tfb_toolset
