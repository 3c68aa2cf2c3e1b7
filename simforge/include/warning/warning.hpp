//! # Simulation Warnings
//!
//! The simulation library reports diagnostics through a C handler. simforge
//! registers `warning_channel_dispatch` as that handler, with a
//! `WarningChannel` as its context pointer; the channel forwards the text to
//! its active translator.
//!
//! ## Translators
//!
//! | Translator         | Behavior                                            |
//! |--------------------|-----------------------------------------------------|
//! | `raise_on_warning` | throws `SimulationWarning` (default)                |
//! | `ignore_warning`   | does nothing                                        |
//!
//! Every warning raises in the default mode. Known warnings get a remediation
//! hint appended; anything else is wrapped in a generic message.
//!
//! ## Suppression
//!
//! ```cpp
//! {
//!     IgnoreWarningsScope quiet(session.warnings());
//!     for (int i = 0; i < 1000; ++i) sim_step(model, data);
//! } // previous translator restored, even if the loop threw
//! ```
//!
//! The channel slot is mutex-guarded, but scopes nesting on one channel from
//! several threads can still restore in the wrong order. Use scopes from a
//! single thread per channel.

#ifndef SIMFORGE_WARNING_WARNING_HPP
#define SIMFORGE_WARNING_WARNING_HPP

#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace simforge::warning {

/// A known warning: `pattern` is matched as a substring.
struct WarningRule {
    std::string pattern;
    std::string hint;
};

/// Known warnings in priority order. First match wins.
const std::vector<WarningRule>& warning_rules();

/// A simulation diagnostic turned into a C++ exception.
class SimulationWarning : public std::runtime_error {
public:
    explicit SimulationWarning(const std::string& message) : std::runtime_error(message) {}
};

/// Message `raise_on_warning` throws for `text`.
std::string warning_message(std::string_view text);

/// Throws SimulationWarning for any `text`.
[[noreturn]] void raise_on_warning(std::string_view text);

/// Discards `text`.
void ignore_warning(std::string_view text);

using Translator = void (*)(std::string_view text);

/// Holds the active translator for one simulation module.
class WarningChannel {
public:
    explicit WarningChannel(Translator initial = raise_on_warning) : translator_(initial) {}

    WarningChannel(const WarningChannel&) = delete;
    WarningChannel& operator=(const WarningChannel&) = delete;

    Translator translator() const;

    /// Installs `translator` and returns the one it replaced.
    Translator set_translator(Translator translator);

    /// Runs the active translator on `text`. May throw.
    void dispatch(std::string_view text) const;

private:
    mutable std::mutex mutex_;
    Translator translator_;
};

/// Installs `ignore_warning` on a channel for the lifetime of the scope.
class IgnoreWarningsScope {
public:
    explicit IgnoreWarningsScope(WarningChannel& channel)
        : channel_(channel), previous_(channel.set_translator(ignore_warning)) {}

    ~IgnoreWarningsScope() {
        channel_.set_translator(previous_);
    }

    IgnoreWarningsScope(const IgnoreWarningsScope&) = delete;
    IgnoreWarningsScope& operator=(const IgnoreWarningsScope&) = delete;

    /// Translator that will be restored on exit.
    Translator previous() const {
        return previous_;
    }

private:
    WarningChannel& channel_;
    Translator previous_;
};

} // namespace simforge::warning

/// C handler registered with the simulation library. `ctx` is a
/// `simforge::warning::WarningChannel*`; a null `ctx` or `text` is ignored.
extern "C" void warning_channel_dispatch(void* ctx, const char* text);

#endif // SIMFORGE_WARNING_WARNING_HPP
