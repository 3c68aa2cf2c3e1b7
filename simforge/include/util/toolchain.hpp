//! # Toolchain Discovery
//!
//! | Function             | Description                                   |
//! |----------------------|-----------------------------------------------|
//! | `find_c_compiler()`  | SIMFORGE_CC, then CC, then cc/clang/gcc in PATH |
//! | `find_in_path()`     | Locate an executable by name in PATH          |
//! | `env_flag()`         | Boolean-like environment switch               |

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace simforge::util {

// Find the C compiler used for callback builds.
// Falls back to plain "cc" (resolved by execvp) when nothing is found.
std::string find_c_compiler();

// Find an executable in PATH. Returns nullopt if not found.
std::optional<std::filesystem::path> find_in_path(const std::string& name);

// True if the variable is set to anything other than "", "0", "false", "no", "off".
bool env_flag(const char* name);

// Value of an environment variable, or `fallback` if unset/empty.
std::string env_or(const char* name, const std::string& fallback);

} // namespace simforge::util
