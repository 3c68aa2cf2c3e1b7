//! # simforge Common Types
//!
//! Types and process-wide options shared by every simforge component.
//!
//! ## Overview
//!
//! - **Version Information**: Library version constants
//! - **Runtime Options**: Global configuration for callback builds
//! - **Result Type**: `Result<T, E>` for build and load failures
//!
//! ## Errors
//!
//! Build and load operations return `Result<T, E>`. Exceptions are reserved
//! for failures that must unwind out of a native call (simulation warnings)
//! and for unrecoverable setup errors.

#ifndef SIMFORGE_COMMON_HPP
#define SIMFORGE_COMMON_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <variant>

namespace simforge {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string.
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Runtime Configuration
// ============================================================================

/// Global options for ephemeral builds.
///
/// # Example
///
/// ```cpp
/// RuntimeOptions::verbose = true;
/// RuntimeOptions::work_dir = "/tmp/my-callbacks";
/// ```
struct RuntimeOptions {
    /// Log compiler invocations and output at info level instead of debug.
    static inline bool verbose = false;

    /// Directory where transient callback sources and libraries are written.
    /// Empty means `<system temp>/simforge`.
    static inline std::filesystem::path work_dir;

    /// Keep generated files even when the debug environment switch is unset.
    static inline bool keep_build_files = false;

    /// Optimization flag passed to the C compiler for callbacks.
    static inline std::string optimization_flag = "-O2";
};

/// Environment variable that disables cleanup of callback build files.
constexpr const char* DEBUG_FN_BUILDER_ENV = "SIMFORGE_DEBUG_FN_BUILDER";

/// Returns the effective work directory, creating it if needed.
std::filesystem::path effective_work_dir();

/// Returns the platform shared library extension (".so", ".dylib", ".dll").
std::string shared_library_extension();

// ============================================================================
// Result Type
// ============================================================================

/// Success value `T` or error `E`.
///
/// # Example
///
/// ```cpp
/// Result<CallbackHandle, BuildError> r = build_callback_fn(src, {}, install);
/// if (is_ok(r)) {
///     auto fn = unwrap(r);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Success value; `std::bad_variant_access` if `result` holds an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Error value; `std::bad_variant_access` on success.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace simforge

#endif // SIMFORGE_COMMON_HPP
