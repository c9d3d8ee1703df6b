#ifndef METADATA_HPP
#define METADATA_HPP

#include "metadata/named.hpp"
#include "utils/toolset_error.hpp"
#include <utility>
#include <vector>

namespace tfb_toolset {

template <typename T>
struct ListResult {
    bool success = true;
    std::vector<T> items;
    ToolsetError error;

    static ListResult failure(ToolsetError error) {
        ListResult result;
        result.success = false;
        result.error = std::move(error);
        return result;
    }
};

// Source of framework and test definitions
class Metadata {
public:
    virtual ~Metadata() = default;

    virtual ListResult<Framework> listAllFrameworks() const = 0;
    virtual ListResult<Test> listAllTests() const = 0;
    virtual ListResult<Test> listTestsByTag(const std::string& tag) const = 0;
    virtual ListResult<Test> listTestsForFramework(const std::string& framework) const = 0;

protected:
    Metadata() = default;
};

} // namespace tfb_toolset

#endif // METADATA_HPP
