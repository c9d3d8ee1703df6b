#ifndef ENVIRONMENT_HPP
#define ENVIRONMENT_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace tfb_toolset {

// Abstract view of the process environment used to locate the
// FrameworkBenchmarks directory
class Environment {
public:
    virtual ~Environment() = default;

    // Factory method - creates the implementation backed by the running process
    static std::unique_ptr<Environment> create();

    // Value of an environment variable, if set
    virtual std::optional<std::string> getVariable(const std::string& name) const = 0;

    // The user's home directory, if it can be determined
    virtual std::optional<std::filesystem::path> homeDirectory() const = 0;

    // The process working directory, if it can be determined
    virtual std::optional<std::filesystem::path> currentDirectory() const = 0;

protected:
    Environment() = default;
};

} // namespace tfb_toolset

#endif // ENVIRONMENT_HPP
