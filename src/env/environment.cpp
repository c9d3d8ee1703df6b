#include "env/environment.hpp"
#include <cstdlib>
#include <system_error>

#if defined(__unix__) || defined(__APPLE__)
#include <pwd.h>
#include <unistd.h>
#endif

namespace tfb_toolset {

namespace {

class ProcessEnvironment : public Environment {
public:
    std::optional<std::string> getVariable(const std::string& name) const override {
        const char* value = std::getenv(name.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    }

    std::optional<std::filesystem::path> homeDirectory() const override {
#if defined(_WIN32)
        if (auto profile = getVariable("USERPROFILE")) {
            return std::filesystem::path(*profile);
        }
#else
        if (auto home = getVariable("HOME"); home && !home->empty()) {
            return std::filesystem::path(*home);
        }
        // HOME unset, e.g. under some service managers
        if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) {
            return std::filesystem::path(pw->pw_dir);
        }
#endif
        return std::nullopt;
    }

    std::optional<std::filesystem::path> currentDirectory() const override {
        std::error_code ec;
        auto cwd = std::filesystem::current_path(ec);
        if (ec) {
            return std::nullopt;
        }
        return cwd;
    }
};

} // namespace

std::unique_ptr<Environment> Environment::create() {
    return std::make_unique<ProcessEnvironment>();
}

} // namespace tfb_toolset
