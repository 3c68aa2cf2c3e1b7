//! # Callback Source Synthesis
//!
//! Renders the translation unit compiled for a callback:
//!
//! ```c
//! #include <stdint.h>
//! #include <simulation.h>
//! #define my_sum d->userdata[0]
//! void fun(const Model* m, Data* d) { my_sum += 1; }
//! uintptr_t __fun = (uintptr_t) fun;
//! ```
//!
//! Alias names become `#define`s onto the per-step user data slots, so they
//! are limited in the same ways any C macro is.

#ifndef SIMFORGE_BUILD_SOURCE_SYNTH_HPP
#define SIMFORGE_BUILD_SOURCE_SYNTH_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace simforge::build {

/// Name of the exported integer holding the callback's address.
constexpr const char* CALLBACK_SYMBOL = "__fun";

/// Name of the function every callback body must define.
constexpr const char* CALLBACK_FUNCTION = "fun";

/// Validated input of a callback build.
class BuildRequest {
public:
    const std::string& function_source() const {
        return function_source_;
    }

    const std::vector<std::string>& aliases() const {
        return aliases_;
    }

private:
    friend Result<BuildRequest, std::string> make_build_request(std::string function_source,
                                                                std::vector<std::string> aliases);

    BuildRequest(std::string function_source, std::vector<std::string> aliases)
        : function_source_(std::move(function_source)), aliases_(std::move(aliases)) {}

    std::string function_source_;
    std::vector<std::string> aliases_;
};

/// Validates alias names and builds a request.
///
/// Fails if an alias is not a C identifier, is a C keyword, or appears twice.
/// The function source itself is not inspected.
Result<BuildRequest, std::string> make_build_request(std::string function_source,
                                                     std::vector<std::string> aliases = {});

/// True if `name` is usable as a macro name in C.
bool is_c_identifier(std::string_view name);

/// Renders the complete translation unit. `header` is the simulation
/// library's public header, e.g. "simulation.h".
std::string render_callback_source(const BuildRequest& request, std::string_view header);

} // namespace simforge::build

#endif // SIMFORGE_BUILD_SOURCE_SYNTH_HPP
