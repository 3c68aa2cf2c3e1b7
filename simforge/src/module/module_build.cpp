#include "module/module_build.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <stdexcept>

namespace simforge::module {

const char* state_name(BuildState state) {
    switch (state) {
    case BuildState::Attempting:
        return "attempting";
    case BuildState::Succeeded:
        return "succeeded";
    case BuildState::ExhaustedFailed:
        return "exhausted";
    }
    return "unknown";
}

const char* failure_kind_name(FailureKind kind) {
    switch (kind) {
    case FailureKind::Process:
        return "process";
    case FailureKind::Timeout:
        return "timeout";
    case FailureKind::Load:
        return "load";
    }
    return "unknown";
}

// ============================================================================
// ProcessBuildEnvironment
// ============================================================================

util::ProcessResult ProcessBuildEnvironment::run_build(int timeout_seconds) {
    std::error_code ec;
    fs::create_directories(config_.artifact_dir, ec);
    if (!config_.workspace_dir.empty()) {
        fs::create_directories(config_.workspace_dir, ec);
    }

    SIMFORGE_LOG_DEBUG("module", util::format_command(config_.build_command));
    auto result = util::run_process(config_.build_command, timeout_seconds);
    if (!result.output.empty()) {
        SIMFORGE_LOG_DEBUG("module", result.output);
    }
    return result;
}

std::vector<fs::path> ProcessBuildEnvironment::find_artifacts() {
    std::vector<fs::path> found;
    std::error_code ec;
    for (fs::directory_iterator it(config_.artifact_dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) &&
            it->path().extension() == config_.artifact_extension) {
            found.push_back(it->path());
        }
    }
    std::sort(found.begin(), found.end());
    return found;
}

Result<loader::LoadedArtifact*, build::BuildError>
ProcessBuildEnvironment::load(const fs::path& artifact) {
    return loader_.load(config_.module_name, artifact);
}

void ProcessBuildEnvironment::clean_workspace() {
    std::error_code ec;
    if (!config_.workspace_dir.empty()) {
        fs::remove_all(config_.workspace_dir, ec);
        if (ec) {
            SIMFORGE_LOG_WARN("cleanup", "Failed to remove " << config_.workspace_dir.string()
                                                             << ": " << ec.message());
        }
    }
    // A half-written library would be picked up again by the next attempt
    for (const auto& artifact : find_artifacts()) {
        fs::remove(artifact, ec);
        if (ec) {
            SIMFORGE_LOG_WARN("cleanup",
                              "Failed to remove " << artifact.string() << ": " << ec.message());
        }
    }
}

// ============================================================================
// ModuleBuildOrchestrator
// ============================================================================

ModuleBuildOrchestrator::ModuleBuildOrchestrator(ModuleBuildEnvironment& env, int max_attempts,
                                                 int timeout_seconds)
    : env_(env), max_attempts_(std::max(1, max_attempts)), timeout_seconds_(timeout_seconds) {}

Result<loader::LoadedArtifact*, AttemptFailure> ModuleBuildOrchestrator::attempt(int number) {
    auto proc = env_.run_build(timeout_seconds_);
    if (proc.timed_out) {
        return AttemptFailure{number, FailureKind::Timeout,
                              "Build timed out after " + std::to_string(timeout_seconds_) + "s"};
    }
    if (!proc.success()) {
        std::string message = proc.launched
                                  ? "Build exited with code " + std::to_string(proc.exit_code)
                                  : "Build command could not be launched";
        if (!proc.output.empty()) {
            message += "\n" + proc.output;
        }
        return AttemptFailure{number, FailureKind::Process, message};
    }

    auto artifacts = env_.find_artifacts();
    if (artifacts.size() != 1) {
        return AttemptFailure{number, FailureKind::Load,
                              "Expected exactly one module library, found " +
                                  std::to_string(artifacts.size())};
    }

    auto loaded = env_.load(artifacts.front());
    if (is_err(loaded)) {
        return AttemptFailure{number, FailureKind::Load, unwrap_err(loaded).message};
    }
    return unwrap(loaded);
}

ModuleBuildOutcome ModuleBuildOrchestrator::run() {
    ModuleBuildOutcome outcome;

    while (outcome.state == BuildState::Attempting) {
        int number = ++outcome.attempts;
        SIMFORGE_LOG_INFO("module", "Build attempt " << number << "/" << max_attempts_);

        auto result = attempt(number);
        if (is_ok(result)) {
            outcome.artifact = unwrap(result);
            outcome.state = BuildState::Succeeded;
            break;
        }

        const AttemptFailure& failure = unwrap_err(result);
        SIMFORGE_LOG_WARN("module", "Attempt " << number << " failed ("
                                               << failure_kind_name(failure.kind)
                                               << "): " << failure.message);
        outcome.failures.push_back(failure);

        // Every failed attempt leaves a clean tree, the last one included
        env_.clean_workspace();
        ++outcome.cleanups;

        if (number >= max_attempts_) {
            outcome.state = BuildState::ExhaustedFailed;
            break;
        }
    }

    SIMFORGE_LOG_DEBUG("module", "Module build " << state_name(outcome.state) << " after "
                                                 << outcome.attempts << " attempt(s)");
    return outcome;
}

// ============================================================================
// Entry Points
// ============================================================================

loader::LoadedArtifact& build_module_or_throw(ModuleBuildEnvironment& env,
                                              const ModuleBuildConfig& config) {
    ModuleBuildOrchestrator orchestrator(env, config.max_attempts, config.timeout_seconds);
    auto outcome = orchestrator.run();
    if (!outcome.succeeded()) {
        std::string message = "Failed to compile extension module '" + config.module_name +
                               "' after " + std::to_string(outcome.attempts) + " attempt(s)";
        if (!outcome.failures.empty()) {
            message += ": " + outcome.failures.back().message;
        }
        SIMFORGE_LOG_FATAL("module", message);
        throw std::runtime_error(message);
    }
    return *outcome.artifact;
}

loader::LoadedArtifact& build_module_or_throw(const ModuleBuildConfig& config) {
    ProcessBuildEnvironment env(config);
    return build_module_or_throw(env, config);
}

} // namespace simforge::module
