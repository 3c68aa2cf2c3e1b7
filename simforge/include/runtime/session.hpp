//! # Session
//!
//! Wires the extension module into the process:
//!
//! 1. build and load the module (`build_module_or_throw`)
//! 2. publish its `_sim_*` exports as `sim_*` in a FunctionRegistry
//! 3. check the license key (a missing key is only reported)
//! 4. call `sim_activate(key_path)` if the module exports it
//! 5. register `warning_channel_dispatch` through `sim_set_warning_handler`,
//!    with the session's WarningChannel in raising mode
//!
//! A Session is heap-allocated and never moves: the module keeps a pointer to
//! its WarningChannel. The destructor hands the module a null handler, so
//! warnings emitted after the session is gone are dropped by the module.

#ifndef SIMFORGE_RUNTIME_SESSION_HPP
#define SIMFORGE_RUNTIME_SESSION_HPP

#include "build/callback_builder.hpp"
#include "loader/function_registry.hpp"
#include "module/module_build.hpp"
#include "runtime/installation.hpp"
#include "warning/warning.hpp"

#include <memory>

namespace simforge::runtime {

/// Module export that activates the license.
constexpr const char* ACTIVATE_FUNCTION = "sim_activate";

/// Module export that installs the C warning handler.
constexpr const char* SET_WARNING_HANDLER_FUNCTION = "sim_set_warning_handler";

using ActivateFn = int (*)(const char* key_path);
using WarningHandlerFn = void (*)(void* ctx, const char* text);
using SetWarningHandlerFn = void (*)(WarningHandlerFn handler, void* ctx);

struct SessionConfig {
    Installation installation;
    module::ModuleBuildConfig module;
    loader::RenameRule rename_rule;
    build::CallbackBuildOptions callback_options;
};

class Session {
public:
    /// Builds the module and wires it up. Throws std::runtime_error if the
    /// module cannot be built or its symbol table cannot be read.
    static std::unique_ptr<Session> open(SessionConfig config);

    /// Same, with an explicit build environment for the module.
    static std::unique_ptr<Session> open(SessionConfig config, module::ModuleBuildEnvironment& env);

    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const loader::FunctionRegistry& functions() const {
        return functions_;
    }

    warning::WarningChannel& warnings() {
        return warnings_;
    }

    const Installation& installation() const {
        return config_.installation;
    }

    loader::LoadedArtifact& extension() const {
        return module_;
    }

    /// Calls the module's activation export. False if it is missing or
    /// reports failure.
    bool activate();

    /// Whether the warning handler was registered with the module.
    bool warning_handler_installed() const {
        return handler_installed_;
    }

    /// Compiles a callback against this session's installation.
    Result<build::CallbackHandle, build::BuildError>
    build_callback(const std::string& function_source, const std::vector<std::string>& aliases = {});

private:
    Session(SessionConfig config, loader::LoadedArtifact& module);

    void install_warning_handler();

    SessionConfig config_;
    loader::LoadedArtifact& module_;
    loader::FunctionRegistry functions_;
    warning::WarningChannel warnings_;
    bool handler_installed_ = false;
};

} // namespace simforge::runtime

#endif // SIMFORGE_RUNTIME_SESSION_HPP
