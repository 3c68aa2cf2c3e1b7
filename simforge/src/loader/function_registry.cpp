#include "loader/function_registry.hpp"

#include "log/log.hpp"

namespace simforge::loader {

std::optional<std::string> RenameRule::apply(const std::string& exported) const {
    if (!exported.starts_with(match_prefix) || exported.size() == match_prefix.size()) {
        return std::nullopt;
    }
    return replacement + exported.substr(match_prefix.size());
}

// ============================================================================
// FunctionRegistry
// ============================================================================

FunctionRegistry FunctionRegistry::build(const LoadedArtifact& artifact,
                                         const std::vector<std::string>& exported,
                                         const RenameRule& rule) {
    FunctionRegistry registry;
    for (const auto& name : exported) {
        auto short_name = rule.apply(name);
        if (!short_name)
            continue;

        void* address = artifact.symbol(name);
        if (!address) {
            // Local (static) symbols are in the table but not exported
            SIMFORGE_LOG_TRACE("loader", "Skipping unexported symbol " << name);
            continue;
        }
        registry.publish(*short_name, address);
    }

    SIMFORGE_LOG_DEBUG("loader", "Registered " << registry.size() << " function(s) from '"
                                               << artifact.name() << "'");
    return registry;
}

void FunctionRegistry::publish(const std::string& name, void* address) {
    entries_[name] = address;
}

void* FunctionRegistry::lookup(const std::string& name) const {
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : it->second;
}

std::vector<std::string> FunctionRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [name, _] : entries_) {
        result.push_back(name);
    }
    return result;
}

} // namespace simforge::loader
