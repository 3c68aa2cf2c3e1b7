//! # Ephemeral Builder
//!
//! ## Compiler Flags Used
//!
//! - `-shared -fPIC`: position-independent shared library
//! - `-I<include_dir>`: simulation library public header
//! - `-L<library_dir> -l<name>`: link the simulation library so callbacks may
//!   call into it
//! - `-Wl,-rpath,<library_dir>`: resolve the simulation library at load time
//!   without LD_LIBRARY_PATH (not used on macOS, see platform_linker)

#include "build/ephemeral_builder.hpp"

#include "build/artifact_janitor.hpp"
#include "log/log.hpp"
#include "util/process.hpp"
#include "util/toolchain.hpp"

#include <fstream>

namespace simforge::build {

EphemeralBuilder::EphemeralBuilder(runtime::Installation installation, std::string compiler,
                                   fs::path work_dir)
    : installation_(std::move(installation)),
      compiler_(compiler.empty() ? util::find_c_compiler() : std::move(compiler)),
      work_dir_(work_dir.empty() ? effective_work_dir() : std::move(work_dir)) {}

std::vector<std::string> EphemeralBuilder::compile_command(const fs::path& source_file,
                                                           const fs::path& output_file) const {
    std::vector<std::string> argv = {compiler_, "-shared", "-fPIC",
                                     RuntimeOptions::optimization_flag};

    argv.push_back("-I" + installation_.include_dir.string());
    argv.push_back("-L" + installation_.library_dir.string());
#ifndef __APPLE__
    argv.push_back("-Wl,-rpath," + installation_.library_dir.string());
#endif

    argv.push_back("-o");
    argv.push_back(output_file.string());
    argv.push_back(source_file.string());

    // Libraries after the sources so static linkers resolve them
    argv.push_back("-l" + installation_.library_name);
    return argv;
}

Result<CompiledArtifact, BuildError> EphemeralBuilder::build(const std::string& source) const {
    BuildIdentity identity = BuildIdentity::next();
    fs::path prefix = identity.prefix_in(work_dir_);
    fs::path source_file = prefix.string() + ".c";
    fs::path output_file = prefix.string() + shared_library_extension();

    {
        std::ofstream ofs(source_file);
        if (!ofs) {
            cleanup_build_files(prefix);
            return BuildError::build("Failed to write callback source: " + source_file.string());
        }
        ofs << source;
    }

    auto argv = compile_command(source_file, output_file);
    if (RuntimeOptions::verbose) {
        SIMFORGE_LOG_INFO("build", util::format_command(argv));
    } else {
        SIMFORGE_LOG_DEBUG("build", util::format_command(argv));
    }

    auto proc = util::run_process(argv);

    if (!proc.output.empty()) {
        if (RuntimeOptions::verbose) {
            SIMFORGE_LOG_INFO("build", proc.output);
        } else {
            SIMFORGE_LOG_DEBUG("build", proc.output);
        }
    }

    if (!proc.success()) {
        cleanup_build_files(prefix);
        if (!proc.launched) {
            return BuildError::build("Failed to launch C compiler '" + compiler_ + "'",
                                     proc.output);
        }
        SIMFORGE_LOG_ERROR("build", "Compilation of " << identity.token() << " failed with exit code "
                                                      << proc.exit_code);
        return BuildError::build("Callback compilation failed with exit code " +
                                     std::to_string(proc.exit_code),
                                 proc.output);
    }

    std::error_code ec;
    if (!fs::exists(output_file, ec)) {
        cleanup_build_files(prefix);
        return BuildError::build("Shared library was not created: " + output_file.string(),
                                 proc.output);
    }

    SIMFORGE_LOG_DEBUG("build", "Built " << output_file.string() << " in "
                                         << proc.duration_us / 1000 << " ms");
    return CompiledArtifact{output_file, std::move(identity), prefix};
}

} // namespace simforge::build
