#include "warning/warning.hpp"

#include "log/log.hpp"

namespace simforge::warning {

const std::vector<WarningRule>& warning_rules() {
    static const std::vector<WarningRule> rules = {
        {"Pre-allocated constraint buffer is full", "Increase njmax in model XML"},
        {"Pre-allocated contact buffer is full", "Increase nconmax in model XML"},
        {"Unknown warning type", "Check for NaN in simulation."},
    };
    return rules;
}

std::string warning_message(std::string_view text) {
    for (const auto& rule : warning_rules()) {
        if (text.find(rule.pattern) != std::string_view::npos) {
            return std::string(text) + rule.hint;
        }
    }
    return "Got simulation warning: " + std::string(text);
}

void raise_on_warning(std::string_view text) {
    std::string message = warning_message(text);
    SIMFORGE_LOG_DEBUG("warning", "Raising: " << message);
    throw SimulationWarning(message);
}

void ignore_warning(std::string_view text) {
    SIMFORGE_LOG_TRACE("warning", "Ignored: " << text);
}

// ============================================================================
// WarningChannel
// ============================================================================

Translator WarningChannel::translator() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return translator_;
}

Translator WarningChannel::set_translator(Translator translator) {
    std::lock_guard<std::mutex> lock(mutex_);
    Translator previous = translator_;
    translator_ = translator;
    return previous;
}

void WarningChannel::dispatch(std::string_view text) const {
    // Call outside the lock: the translator throws
    Translator active = translator();
    if (active) {
        active(text);
    }
}

} // namespace simforge::warning

extern "C" void warning_channel_dispatch(void* ctx, const char* text) {
    if (!ctx || !text)
        return;
    static_cast<const simforge::warning::WarningChannel*>(ctx)->dispatch(text);
}
