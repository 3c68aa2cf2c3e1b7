//! # Extension Module Build
//!
//! Builds and loads the long-lived extension module once per session. The
//! external build is flaky in practice (interrupted builds leave corrupt
//! objects behind), so a failed attempt wipes the workspace and tries again:
//!
//! ```text
//!            ┌────────────── failure, attempts < max ──────────────┐
//!            │                                                     │
//!            v                                                     │
//!   ┌──────────────┐  run_build → find_artifacts → load   ┌────────┴───┐
//!   │  Attempting  │ ───────────────────────────────────> │  (failure) │
//!   └──────┬───────┘                                      └────────┬───┘
//!          │ loaded                           attempts == max      │
//!          v                                                       v
//!   ┌──────────────┐                                    ┌─────────────────┐
//!   │  Succeeded   │                                    │ ExhaustedFailed │
//!   └──────────────┘                                    └─────────────────┘
//! ```
//!
//! Every failure runs `clean_workspace()` before the attempt cap is checked,
//! so an exhausted build leaves no partial artifacts either.
//!
//! Retried failures: the build command exits non-zero or cannot start, it
//! exceeds its time budget, or the produced artifact cannot be found (zero or
//! several candidates) or loaded.

#ifndef SIMFORGE_MODULE_MODULE_BUILD_HPP
#define SIMFORGE_MODULE_MODULE_BUILD_HPP

#include "build/build_error.hpp"
#include "common.hpp"
#include "loader/artifact_loader.hpp"
#include "util/process.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace simforge::module {

namespace fs = std::filesystem;

enum class BuildState { Attempting, Succeeded, ExhaustedFailed };

const char* state_name(BuildState state);

enum class FailureKind {
    Process, ///< Build command failed or could not be launched
    Timeout, ///< Build command killed after the time budget
    Load     ///< No unique artifact, or dlopen failed
};

const char* failure_kind_name(FailureKind kind);

struct AttemptFailure {
    int attempt = 0;
    FailureKind kind = FailureKind::Process;
    std::string message;
};

struct ModuleBuildConfig {
    std::vector<std::string> build_command;
    fs::path workspace_dir; ///< Intermediate build files, wiped between attempts
    fs::path artifact_dir;  ///< Where the single module library is produced
    std::string artifact_extension = shared_library_extension();
    std::string module_name = "simext";
    int max_attempts = 3;
    int timeout_seconds = 150;
};

/// The side effects of one build attempt. Tests substitute scripted ones.
class ModuleBuildEnvironment {
public:
    virtual ~ModuleBuildEnvironment() = default;

    virtual util::ProcessResult run_build(int timeout_seconds) = 0;

    /// Candidate module libraries currently on disk.
    virtual std::vector<fs::path> find_artifacts() = 0;

    virtual Result<loader::LoadedArtifact*, build::BuildError> load(const fs::path& artifact) = 0;

    /// Destroys everything a previous attempt may have left behind.
    virtual void clean_workspace() = 0;
};

/// Runs the configured command and loads through an ArtifactLoader.
class ProcessBuildEnvironment : public ModuleBuildEnvironment {
public:
    explicit ProcessBuildEnvironment(ModuleBuildConfig config,
                                     loader::ArtifactLoader& loader = loader::ArtifactLoader::global())
        : config_(std::move(config)), loader_(loader) {}

    util::ProcessResult run_build(int timeout_seconds) override;
    std::vector<fs::path> find_artifacts() override;
    Result<loader::LoadedArtifact*, build::BuildError> load(const fs::path& artifact) override;
    void clean_workspace() override;

    const ModuleBuildConfig& config() const {
        return config_;
    }

private:
    ModuleBuildConfig config_;
    loader::ArtifactLoader& loader_;
};

struct ModuleBuildOutcome {
    BuildState state = BuildState::Attempting;
    int attempts = 0;
    int cleanups = 0;
    loader::LoadedArtifact* artifact = nullptr;
    std::vector<AttemptFailure> failures;

    bool succeeded() const {
        return state == BuildState::Succeeded;
    }
};

class ModuleBuildOrchestrator {
public:
    ModuleBuildOrchestrator(ModuleBuildEnvironment& env, int max_attempts = 3,
                            int timeout_seconds = 150);

    /// Runs attempts until one succeeds or `max_attempts` have failed.
    ModuleBuildOutcome run();

private:
    Result<loader::LoadedArtifact*, AttemptFailure> attempt(int number);

    ModuleBuildEnvironment& env_;
    int max_attempts_;
    int timeout_seconds_;
};

/// Runs the orchestrator and returns the loaded module. Exhaustion is logged
/// at fatal level and thrown as std::runtime_error.
loader::LoadedArtifact& build_module_or_throw(ModuleBuildEnvironment& env,
                                              const ModuleBuildConfig& config);

/// Same, with a ProcessBuildEnvironment for `config`.
loader::LoadedArtifact& build_module_or_throw(const ModuleBuildConfig& config);

} // namespace simforge::module

#endif // SIMFORGE_MODULE_MODULE_BUILD_HPP
