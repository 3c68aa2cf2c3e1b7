//! # Callback Builder
//!
//! The end-to-end pipeline behind `build_callback_fn()`:
//!
//! ```text
//! make_build_request → render_callback_source → EphemeralBuilder::build
//!     → relink_in_place (macOS) → ArtifactLoader::load → read `__fun`
//!     → cleanup_build_files → CallbackHandle
//! ```
//!
//! Generated files are removed on every path once the identity exists,
//! success included. The returned address stays valid after its files are
//! gone since the library remains mapped for the life of the process.
//!
//! ## Example
//!
//! ```cpp
//! auto install = unwrap(runtime::Installation::from_environment());
//! auto r = build::build_callback_fn(
//!     "void fun(const Model* m, Data* d) { energy += d->time; }", {"energy"}, install);
//! if (is_ok(r)) {
//!     sim_set_step_callback(unwrap(r));
//! }
//! ```

#ifndef SIMFORGE_BUILD_CALLBACK_BUILDER_HPP
#define SIMFORGE_BUILD_CALLBACK_BUILDER_HPP

#include "build/build_error.hpp"
#include "common.hpp"
#include "runtime/installation.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace simforge::build {

/// Address of a compiled `void fun(const Model*, Data*)`.
using CallbackHandle = uintptr_t;

struct CallbackBuildOptions {
    std::string compiler;           ///< Empty: util::find_c_compiler()
    std::filesystem::path work_dir; ///< Empty: effective_work_dir()
};

/// Compiles `function_source` (which must define `fun`) with `aliases` bound
/// to `d->userdata[0..N-1]` and returns the address of `fun`.
Result<CallbackHandle, BuildError> build_callback_fn(const std::string& function_source,
                                                     const std::vector<std::string>& aliases,
                                                     const runtime::Installation& installation,
                                                     const CallbackBuildOptions& options = {});

} // namespace simforge::build

#endif // SIMFORGE_BUILD_CALLBACK_BUILDER_HPP
