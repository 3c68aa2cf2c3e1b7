//! # Artifact Janitor
//!
//! Removes the transient files of one build (`<prefix>.c`, `<prefix>.so`,
//! relink copies, ...). Set SIMFORGE_DEBUG_FN_BUILDER to keep them for
//! post-mortem inspection.

#ifndef SIMFORGE_BUILD_ARTIFACT_JANITOR_HPP
#define SIMFORGE_BUILD_ARTIFACT_JANITOR_HPP

#include <cstddef>
#include <filesystem>

namespace simforge::build {

/// True when cleanup is disabled by the debug switch or by
/// `RuntimeOptions::keep_build_files`.
bool cleanup_disabled();

/// Deletes every regular file in `prefix.parent_path()` whose name starts with
/// `prefix.filename()`. Removal errors are logged and skipped.
///
/// Returns the number of files removed (0 when cleanup is disabled).
size_t cleanup_build_files(const std::filesystem::path& prefix);

} // namespace simforge::build

#endif // SIMFORGE_BUILD_ARTIFACT_JANITOR_HPP
