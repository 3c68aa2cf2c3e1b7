//! # Platform Linker
//!
//! On macOS the simulation library records its install name as
//! `@executable_path/lib<name>.dylib`, which does not resolve from inside a
//! callback library loaded by a host process elsewhere. The fix rewrites
//! that reference to the absolute library path with `install_name_tool`.
//!
//! ```text
//! <token>.dylib → copy → <token>_final.dylib~ → install_name_tool -change
//!               → rename → <token>_final.dylib  (caller moves it back over <token>.dylib)
//! ```

#ifndef SIMFORGE_BUILD_PLATFORM_LINKER_HPP
#define SIMFORGE_BUILD_PLATFORM_LINKER_HPP

#include "build/build_error.hpp"
#include "common.hpp"
#include "runtime/installation.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace simforge::build {

namespace fs = std::filesystem;

/// True on platforms where built artifacts must be relinked before loading.
constexpr bool requires_relink() {
#ifdef __APPLE__
    return true;
#else
    return false;
#endif
}

class PlatformLinker {
public:
    /// `tool` is the install-name rewriting tool; tests substitute another.
    explicit PlatformLinker(std::string tool = "install_name_tool") : tool_(std::move(tool)) {}

    /// Writes a corrected copy of `artifact` and returns its path.
    Result<fs::path, BuildError> relink(const runtime::Installation& installation,
                                        const fs::path& artifact) const;

    /// `<stem>_final<ext>` next to `artifact`.
    static fs::path final_path(const fs::path& artifact);

    /// Arguments for rewriting the library reference inside `target`.
    std::vector<std::string> rewrite_command(const runtime::Installation& installation,
                                             const fs::path& target) const;

private:
    std::string tool_;
};

/// Relinks `artifact` and moves the result over it, keeping the original path.
Result<fs::path, BuildError> relink_in_place(const PlatformLinker& linker,
                                             const runtime::Installation& installation,
                                             const fs::path& artifact);

} // namespace simforge::build

#endif // SIMFORGE_BUILD_PLATFORM_LINKER_HPP
