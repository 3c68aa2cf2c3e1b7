#include "common.hpp"

#include "log/log.hpp"

namespace fs = std::filesystem;

namespace simforge {

fs::path effective_work_dir() {
    fs::path dir = RuntimeOptions::work_dir;
    if (dir.empty()) {
        dir = fs::temp_directory_path() / "simforge";
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        SIMFORGE_LOG_WARN("build", "Could not create work directory " << dir << ": "
                                                                       << ec.message());
    }
    return dir;
}

std::string shared_library_extension() {
#if defined(_WIN32)
    return ".dll";
#elif defined(__APPLE__)
    return ".dylib";
#else
    return ".so";
#endif
}

} // namespace simforge
