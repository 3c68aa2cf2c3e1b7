#include "runtime/session.hpp"

#include "log/log.hpp"

#include <stdexcept>

namespace simforge::runtime {

Session::Session(SessionConfig config, loader::LoadedArtifact& module)
    : config_(std::move(config)), module_(module) {}

Session::~Session() {
    if (!handler_installed_)
        return;

    // The module outlives us; it must not keep calling into warnings_
    auto set_handler = functions_.get<SetWarningHandlerFn>(SET_WARNING_HANDLER_FUNCTION);
    if (set_handler) {
        set_handler(nullptr, nullptr);
    }
    SIMFORGE_LOG_DEBUG("session", "Warning handler removed from '" << module_.name() << "'");
}

std::unique_ptr<Session> Session::open(SessionConfig config) {
    module::ProcessBuildEnvironment env(config.module);
    return open(std::move(config), env);
}

std::unique_ptr<Session> Session::open(SessionConfig config, module::ModuleBuildEnvironment& env) {
    loader::LoadedArtifact& artifact = module::build_module_or_throw(env, config.module);

    auto symbols = artifact.exported_symbols();
    if (is_err(symbols)) {
        std::string message = "Cannot read exports of '" + artifact.name() +
                               "': " + unwrap_err(symbols);
        SIMFORGE_LOG_ERROR("session", message);
        throw std::runtime_error(message);
    }

    std::unique_ptr<Session> session(new Session(std::move(config), artifact));
    session->functions_ =
        loader::FunctionRegistry::build(artifact, unwrap(symbols), session->config_.rename_rule);

    find_key(session->config_.installation);
    session->activate();
    session->install_warning_handler();

    SIMFORGE_LOG_INFO("session", "Session ready: " << session->functions_.size()
                                                   << " module function(s)");
    return session;
}

bool Session::activate() {
    auto activate_fn = functions_.get<ActivateFn>(ACTIVATE_FUNCTION);
    if (!activate_fn) {
        SIMFORGE_LOG_DEBUG("session", "Module has no " << ACTIVATE_FUNCTION << "()");
        return false;
    }

    const std::string key = config_.installation.key_path.string();
    int ok = activate_fn(key.c_str());
    if (!ok) {
        SIMFORGE_LOG_WARN("session", "Activation with " << key << " failed");
        return false;
    }
    return true;
}

void Session::install_warning_handler() {
    auto set_handler = functions_.get<SetWarningHandlerFn>(SET_WARNING_HANDLER_FUNCTION);
    if (!set_handler) {
        SIMFORGE_LOG_WARN("session", "Module has no " << SET_WARNING_HANDLER_FUNCTION
                                                      << "(), warnings will not be translated");
        return;
    }

    warnings_.set_translator(warning::raise_on_warning);
    set_handler(warning_channel_dispatch, &warnings_);
    handler_installed_ = true;
}

Result<build::CallbackHandle, build::BuildError>
Session::build_callback(const std::string& function_source,
                        const std::vector<std::string>& aliases) {
    return build::build_callback_fn(function_source, aliases, config_.installation,
                                    config_.callback_options);
}

} // namespace simforge::runtime
