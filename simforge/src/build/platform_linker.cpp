#include "build/platform_linker.hpp"

#include "log/log.hpp"
#include "util/process.hpp"

namespace simforge::build {

fs::path PlatformLinker::final_path(const fs::path& artifact) {
    fs::path result = artifact.parent_path() / artifact.stem();
    result += "_final";
    result += artifact.extension();
    return result;
}

std::vector<std::string> PlatformLinker::rewrite_command(const runtime::Installation& installation,
                                                         const fs::path& target) const {
    const std::string lib_file = installation.library_file_name();
    return {tool_, "-change", "@executable_path/" + lib_file,
            (installation.library_dir / lib_file).string(), target.string()};
}

Result<fs::path, BuildError> PlatformLinker::relink(const runtime::Installation& installation,
                                                    const fs::path& artifact) const {
    fs::path final_file = final_path(artifact);
    fs::path tmp_file = final_file;
    tmp_file += "~";

    std::error_code ec;
    fs::copy_file(artifact, tmp_file, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return BuildError::build("Failed to copy " + artifact.string() + " for relinking: " +
                                 ec.message());
    }

    auto argv = rewrite_command(installation, tmp_file);
    SIMFORGE_LOG_DEBUG("link", util::format_command(argv));
    auto proc = util::run_process(argv);
    if (!proc.success()) {
        fs::remove(tmp_file, ec);
        return BuildError::build("Relinking " + artifact.filename().string() + " with '" + tool_ +
                                     "' failed (exit code " + std::to_string(proc.exit_code) + ")",
                                 proc.output);
    }

    fs::rename(tmp_file, final_file, ec);
    if (ec) {
        return BuildError::build("Failed to move relinked library into place: " + ec.message());
    }
    return final_file;
}

Result<fs::path, BuildError> relink_in_place(const PlatformLinker& linker,
                                             const runtime::Installation& installation,
                                             const fs::path& artifact) {
    auto relinked = linker.relink(installation, artifact);
    if (is_err(relinked)) {
        return unwrap_err(relinked);
    }

    std::error_code ec;
    fs::rename(unwrap(relinked), artifact, ec);
    if (ec) {
        return BuildError::build("Failed to overwrite " + artifact.string() +
                                 " with relinked library: " + ec.message());
    }
    SIMFORGE_LOG_DEBUG("link", "Relinked " << artifact.filename().string());
    return artifact;
}

} // namespace simforge::build
