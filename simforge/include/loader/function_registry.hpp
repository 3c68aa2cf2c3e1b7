//! # Function Registry
//!
//! The extension module exports its native entry points as `_sim_<name>`.
//! The registry republishes them under shorter names through one explicit
//! rename rule, built once when the module is loaded:
//!
//! ```text
//! _sim_step          → sim_step
//! _sim_set_warning_handler → sim_set_warning_handler
//! helper_fn          → (not matched, skipped)
//! ```
//!
//! The namespace is flat: if two exports rename to the same name, the later
//! one in symbol-table order wins.

#ifndef SIMFORGE_LOADER_FUNCTION_REGISTRY_HPP
#define SIMFORGE_LOADER_FUNCTION_REGISTRY_HPP

#include "common.hpp"
#include "loader/artifact_loader.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace simforge::loader {

/// Maps exported names with `match_prefix` to `replacement` + rest.
struct RenameRule {
    std::string match_prefix = "_sim_";
    std::string replacement = "sim_";

    /// Renamed form of `exported`, or nullopt if the rule does not apply.
    std::optional<std::string> apply(const std::string& exported) const;
};

class FunctionRegistry {
public:
    FunctionRegistry() = default;

    /// Resolves every name in `exported` that matches `rule` against
    /// `artifact`. Names that do not resolve with dlsym are skipped.
    static FunctionRegistry build(const LoadedArtifact& artifact,
                                  const std::vector<std::string>& exported,
                                  const RenameRule& rule = {});

    /// Publishes `address` under `name`, replacing any previous entry.
    void publish(const std::string& name, void* address);

    /// Address published under `name`, or nullptr.
    void* lookup(const std::string& name) const;

    template <typename Func> Func get(const std::string& name) const {
        return reinterpret_cast<Func>(lookup(name));
    }

    bool contains(const std::string& name) const {
        return entries_.count(name) > 0;
    }

    /// Published names in sorted order.
    std::vector<std::string> names() const;

    size_t size() const {
        return entries_.size();
    }

private:
    std::map<std::string, void*> entries_;
};

} // namespace simforge::loader

#endif // SIMFORGE_LOADER_FUNCTION_REGISTRY_HPP
