#include "runtime/installation.hpp"

#include "log/log.hpp"
#include "util/toolchain.hpp"

#include <sstream>

namespace simforge::runtime {

Installation Installation::from_root(const fs::path& root, const std::string& library_name,
                                     const std::string& header, const fs::path& key_path) {
    Installation inst;
    inst.root = root;
    inst.include_dir = root / "include";
    inst.library_dir = root / "bin";
    inst.library_name = library_name;
    inst.header = header;
    inst.key_path = key_path.empty() ? root / "key.txt" : key_path;
    return inst;
}

Result<Installation, std::string> Installation::from_environment() {
    std::string root = util::env_or("SIMFORGE_SIM_PATH", "");
    if (root.empty()) {
        return std::string("SIMFORGE_SIM_PATH is not set; point it at the simulation library "
                           "installation (the directory containing include/ and bin/)");
    }

    fs::path root_path(root);
    std::error_code ec;
    if (!fs::is_directory(root_path, ec)) {
        return "Simulation library installation not found: " + root;
    }

    return from_root(root_path, util::env_or("SIMFORGE_SIM_LIBRARY", "simulation"),
                     util::env_or("SIMFORGE_SIM_HEADER", "simulation.h"),
                     util::env_or("SIMFORGE_SIM_KEY", ""));
}

std::string Installation::library_file_name() const {
    return "lib" + library_name + shared_library_extension();
}

std::string missing_key_message(const fs::path& key_path) {
    std::ostringstream oss;
    oss << "\n"
        << "You appear to be missing a License Key for the simulation library.\n"
        << "We looked for it in:\n"
        << "    " << key_path.string() << "\n"
        << "Set SIMFORGE_SIM_KEY to the key file's location to use a different path.";
    return oss.str();
}

bool find_key(const Installation& installation) {
    std::error_code ec;
    if (fs::exists(installation.key_path, ec)) {
        return true;
    }
    SIMFORGE_LOG_WARN("session", missing_key_message(installation.key_path));
    return false;
}

} // namespace simforge::runtime
