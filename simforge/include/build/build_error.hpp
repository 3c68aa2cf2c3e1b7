//! # Build Errors
//!
//! Failures of the callback pipeline and of the extension module build.
//! Returned through `Result<T, BuildError>`, never thrown.

#ifndef SIMFORGE_BUILD_BUILD_ERROR_HPP
#define SIMFORGE_BUILD_BUILD_ERROR_HPP

#include <ostream>
#include <string>

namespace simforge::build {

struct BuildError {
    enum class Kind {
        Build, ///< Compiler, linker, relink tool, or timeout failure
        Load   ///< Malformed artifact or missing symbol
    };

    Kind kind = Kind::Build;
    std::string message;
    std::string diagnostics; ///< Captured tool output, may be empty

    static BuildError build(std::string message, std::string diagnostics = {}) {
        return BuildError{Kind::Build, std::move(message), std::move(diagnostics)};
    }

    static BuildError load(std::string message) {
        return BuildError{Kind::Load, std::move(message), {}};
    }

    /// Message followed by the diagnostics block, if any.
    std::string describe() const {
        if (diagnostics.empty())
            return message;
        return message + "\n" + diagnostics;
    }
};

inline const char* kind_name(BuildError::Kind kind) {
    switch (kind) {
    case BuildError::Kind::Build:
        return "build";
    case BuildError::Kind::Load:
        return "load";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, const BuildError& err) {
    return os << kind_name(err.kind) << " error: " << err.message;
}

} // namespace simforge::build

#endif // SIMFORGE_BUILD_BUILD_ERROR_HPP
