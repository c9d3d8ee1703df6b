#ifndef NAMED_HPP
#define NAMED_HPP

#include <algorithm>
#include <string>
#include <vector>

namespace tfb_toolset {

struct Framework {
    std::string name;
    std::string language;

    const std::string& getName() const { return name; }
};

struct Test {
    std::string name;
    std::string framework_name;
    std::vector<std::string> tags;

    const std::string& getName() const { return name; }

    bool hasTag(const std::string& tag) const {
        return std::find(tags.begin(), tags.end(), tag) != tags.end();
    }
};

} // namespace tfb_toolset

#endif // NAMED_HPP
