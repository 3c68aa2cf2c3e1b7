#include "build/callback_builder.hpp"

#include "build/artifact_janitor.hpp"
#include "build/ephemeral_builder.hpp"
#include "build/platform_linker.hpp"
#include "build/source_synth.hpp"
#include "loader/artifact_loader.hpp"
#include "log/log.hpp"

namespace simforge::build {

namespace {

/// Removes a build's files when the pipeline returns, whichever way it does.
class BuildFilesGuard {
public:
    explicit BuildFilesGuard(fs::path prefix) : prefix_(std::move(prefix)) {}
    ~BuildFilesGuard() {
        cleanup_build_files(prefix_);
    }

    BuildFilesGuard(const BuildFilesGuard&) = delete;
    BuildFilesGuard& operator=(const BuildFilesGuard&) = delete;

private:
    fs::path prefix_;
};

} // namespace

Result<CallbackHandle, BuildError> build_callback_fn(const std::string& function_source,
                                                     const std::vector<std::string>& aliases,
                                                     const runtime::Installation& installation,
                                                     const CallbackBuildOptions& options) {
    auto request = make_build_request(function_source, aliases);
    if (is_err(request)) {
        return BuildError::build("Invalid callback request: " + unwrap_err(request));
    }

    std::string source = render_callback_source(unwrap(request), installation.header);

    EphemeralBuilder builder(installation, options.compiler, options.work_dir);
    auto compiled = builder.build(source);
    if (is_err(compiled)) {
        // The builder already removed its files
        return unwrap_err(compiled);
    }
    const CompiledArtifact& artifact = unwrap(compiled);
    BuildFilesGuard guard(artifact.prefix);

    if constexpr (requires_relink()) {
        auto relinked = relink_in_place(PlatformLinker{}, installation, artifact.path);
        if (is_err(relinked)) {
            return unwrap_err(relinked);
        }
    }

    const std::string& token = artifact.identity.token();
    auto loaded = loader::ArtifactLoader::global().load(token, artifact.path);
    if (is_err(loaded)) {
        return unwrap_err(loaded);
    }

    void* symbol = unwrap(loaded)->symbol(CALLBACK_SYMBOL);
    if (!symbol) {
        return BuildError::load(std::string("Symbol '") + CALLBACK_SYMBOL + "' not found in " +
                                artifact.path.filename().string());
    }

    auto handle = *static_cast<const CallbackHandle*>(symbol);
    SIMFORGE_LOG_DEBUG("build", "Callback " << token << " at 0x" << std::hex << handle);
    return handle;
}

} // namespace simforge::build
