//! # Ephemeral Builder
//!
//! Compiles one synthesized callback source into a shared library:
//!
//! ```text
//! <work_dir>/<token>.c  → cc -shared -fPIC → <work_dir>/<token>.so
//!                         -I<include_dir> -L<library_dir> -l<library_name>
//! ```
//!
//! The artifact is left on disk for the loader; the caller cleans it up once
//! the symbol has been read. A failed build cleans up before returning.

#ifndef SIMFORGE_BUILD_EPHEMERAL_BUILDER_HPP
#define SIMFORGE_BUILD_EPHEMERAL_BUILDER_HPP

#include "build/build_error.hpp"
#include "build/build_identity.hpp"
#include "common.hpp"
#include "runtime/installation.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace simforge::build {

namespace fs = std::filesystem;

/// A shared library produced by one build, owned by that build.
struct CompiledArtifact {
    fs::path path;
    BuildIdentity identity;
    fs::path prefix; ///< `<work_dir>/<token>`, what the janitor deletes
};

class EphemeralBuilder {
public:
    /// `compiler` empty means `util::find_c_compiler()`; `work_dir` empty
    /// means `effective_work_dir()`.
    explicit EphemeralBuilder(runtime::Installation installation, std::string compiler = {},
                              fs::path work_dir = {});

    /// Compiles `source` under a fresh BuildIdentity.
    Result<CompiledArtifact, BuildError> build(const std::string& source) const;

    /// The compiler argv used for `source_file` → `output_file`.
    std::vector<std::string> compile_command(const fs::path& source_file,
                                             const fs::path& output_file) const;

    const runtime::Installation& installation() const {
        return installation_;
    }

    const fs::path& work_dir() const {
        return work_dir_;
    }

private:
    runtime::Installation installation_;
    std::string compiler_;
    fs::path work_dir_;
};

} // namespace simforge::build

#endif // SIMFORGE_BUILD_EPHEMERAL_BUILDER_HPP
