#include "util/toolchain.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;

namespace simforge::util {

static bool is_executable(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
}

std::optional<fs::path> find_in_path(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        if (is_executable(name))
            return fs::path(name);
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env)
        return std::nullopt;

    std::istringstream iss(path_env);
    std::string dir;
    while (std::getline(iss, dir, ':')) {
        if (dir.empty())
            continue;
        fs::path candidate = fs::path(dir) / name;
        if (is_executable(candidate))
            return candidate;
    }
    return std::nullopt;
}

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value && *value)
        return value;
    return fallback;
}

bool env_flag(const char* name) {
    std::string value = env_or(name, "");
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return !value.empty() && value != "0" && value != "false" && value != "no" && value != "off";
}

std::string find_c_compiler() {
    for (const char* var : {"SIMFORGE_CC", "CC"}) {
        std::string cc = env_or(var, "");
        if (!cc.empty()) {
            SIMFORGE_LOG_TRACE("build", "C compiler from " << var << ": " << cc);
            return cc;
        }
    }

    const std::vector<std::string> candidates = {"cc", "clang", "gcc"};
    for (const auto& name : candidates) {
        if (auto found = find_in_path(name)) {
            return found->string();
        }
    }
    return "cc";
}

} // namespace simforge::util
