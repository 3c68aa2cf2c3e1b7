//! # Simulation Library Installation
//!
//! Where the precompiled simulation library lives. Callbacks are compiled
//! against `include_dir/header` and linked with `-L library_dir
//! -l library_name`.
//!
//! ## Environment
//!
//! | Variable               | Meaning                         | Default           |
//! |------------------------|---------------------------------|-------------------|
//! | `SIMFORGE_SIM_PATH`    | installation root               | (required)        |
//! | `SIMFORGE_SIM_KEY`     | license key file                | `<root>/key.txt`  |
//! | `SIMFORGE_SIM_LIBRARY` | library name without lib/ext    | `simulation`      |
//! | `SIMFORGE_SIM_HEADER`  | public header                   | `simulation.h`    |

#ifndef SIMFORGE_RUNTIME_INSTALLATION_HPP
#define SIMFORGE_RUNTIME_INSTALLATION_HPP

#include "common.hpp"

#include <filesystem>
#include <string>

namespace simforge::runtime {

namespace fs = std::filesystem;

struct Installation {
    fs::path root;
    fs::path include_dir;
    fs::path library_dir;
    std::string library_name = "simulation";
    std::string header = "simulation.h";
    fs::path key_path;

    /// Derives `include/` and `bin/` from `root`. An empty `key_path` means
    /// `<root>/key.txt`.
    static Installation from_root(const fs::path& root, const std::string& library_name,
                                  const std::string& header, const fs::path& key_path = {});

    /// Reads the SIMFORGE_SIM_* variables.
    static Result<Installation, std::string> from_environment();

    /// File name of the shared library, e.g. "libsimulation.so".
    std::string library_file_name() const;
};

/// Multi-line message printed when the license key file is missing.
std::string missing_key_message(const fs::path& key_path);

/// Checks for the license key. A missing key is reported through the logger
/// and does not stop anything; returns false in that case.
bool find_key(const Installation& installation);

} // namespace simforge::runtime

#endif // SIMFORGE_RUNTIME_INSTALLATION_HPP
