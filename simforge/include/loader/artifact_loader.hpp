//! # Artifact Loader
//!
//! Maps shared artifacts into the process and resolves their symbols.
//!
//! Artifacts are never unloaded: a callback address handed to the simulation
//! loop must stay valid for the rest of the process, even after its file has
//! been deleted from disk.

#ifndef SIMFORGE_LOADER_ARTIFACT_LOADER_HPP
#define SIMFORGE_LOADER_ARTIFACT_LOADER_HPP

#include "build/build_error.hpp"
#include "common.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace simforge::loader {

namespace fs = std::filesystem;

/// A shared library mapped into the process.
class LoadedArtifact {
public:
    LoadedArtifact(std::string name, fs::path path, void* handle)
        : name_(std::move(name)), path_(std::move(path)), handle_(handle) {}

    // Owned by the loader; the mapping outlives every copy of a symbol address
    LoadedArtifact(const LoadedArtifact&) = delete;
    LoadedArtifact& operator=(const LoadedArtifact&) = delete;

    /// Raw address of an exported symbol, or nullptr.
    void* symbol(const std::string& name) const;

    /// Defined symbol names from the artifact file on disk.
    Result<std::vector<std::string>, std::string> exported_symbols() const;

    template <typename Func> Func get_function(const std::string& name) const {
        return reinterpret_cast<Func>(symbol(name));
    }

    const std::string& name() const {
        return name_;
    }

    /// Path the artifact was loaded from (may no longer exist).
    const fs::path& path() const {
        return path_;
    }

private:
    std::string name_;
    fs::path path_;
    void* handle_;
};

/// Defined, named symbols in the symbol table of `artifact` (read with the
/// LLVM object library). Stripped artifacts yield an empty list.
Result<std::vector<std::string>, std::string> read_exported_symbols(const fs::path& artifact);

class ArtifactLoader {
public:
    ArtifactLoader() = default;

    ArtifactLoader(const ArtifactLoader&) = delete;
    ArtifactLoader& operator=(const ArtifactLoader&) = delete;

    /// Process-wide loader used by callback builds and sessions.
    static ArtifactLoader& global();

    /// Loads `path` under `name`. Loading an already-known name returns the
    /// existing artifact without touching `path`.
    Result<LoadedArtifact*, build::BuildError> load(const std::string& name, const fs::path& path);

    /// Previously loaded artifact, or nullptr.
    LoadedArtifact* get(const std::string& name);

    bool is_loaded(const std::string& name) const;

    size_t size() const;

private:
    static void* dl_open(const fs::path& path);
    static std::string dl_error();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<LoadedArtifact>> loaded_;
};

} // namespace simforge::loader

#endif // SIMFORGE_LOADER_ARTIFACT_LOADER_HPP
