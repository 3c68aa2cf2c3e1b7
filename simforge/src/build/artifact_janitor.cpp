#include "build/artifact_janitor.hpp"

#include "common.hpp"
#include "log/log.hpp"
#include "util/toolchain.hpp"

#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace simforge::build {

bool cleanup_disabled() {
    return RuntimeOptions::keep_build_files || util::env_flag(DEBUG_FN_BUILDER_ENV);
}

size_t cleanup_build_files(const fs::path& prefix) {
    if (cleanup_disabled()) {
        SIMFORGE_LOG_INFO("cleanup", "Keeping build files " << prefix.string() << "* ("
                                                            << DEBUG_FN_BUILDER_ENV << " set)");
        return 0;
    }

    fs::path dir = prefix.parent_path();
    if (dir.empty())
        dir = ".";
    const std::string stem = prefix.filename().string();

    // Collect first: removing while iterating a directory is unspecified
    std::vector<fs::path> matches;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        std::error_code type_ec;
        if (name.starts_with(stem) && !it->is_directory(type_ec)) {
            matches.push_back(it->path());
        }
    }
    if (ec) {
        SIMFORGE_LOG_WARN("cleanup", "Error listing " << dir << ", continuing anyway: "
                                                     << ec.message());
    }

    size_t removed = 0;
    for (const auto& path : matches) {
        std::error_code rm_ec;
        if (fs::remove(path, rm_ec)) {
            ++removed;
        } else if (rm_ec) {
            SIMFORGE_LOG_WARN("cleanup", "Error removing " << path.string()
                                                          << ", continuing anyway: "
                                                          << rm_ec.message());
        }
    }

    SIMFORGE_LOG_DEBUG("cleanup", "Removed " << removed << " file(s) for " << stem);
    return removed;
}

} // namespace simforge::build
