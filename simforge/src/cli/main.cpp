//! # simforge Command Line
//!
//! ```text
//! simforge_main()
//!   ├─ --help, -h      → print_usage()
//!   ├─ --version, -V   → print_version()
//!   └─ build-callback  → run_build_callback()
//! ```
//!
//! ## Usage
//!
//! ```bash
//! simforge build-callback step.c --alias energy,count --sim-root /opt/sim
//! SIMFORGE_SIM_PATH=/opt/sim simforge build-callback step.c --keep-files -vv
//! ```
//!
//! Logging flags (`--log-level=`, `--log-filter=`, `--log-file=`,
//! `--log-format=`, `-v`/`-vv`/`-vvv`, `-q`) are accepted anywhere on the
//! command line.

#include "build/callback_builder.hpp"
#include "common.hpp"
#include "log/log.hpp"
#include "runtime/installation.hpp"
#include "util/toolchain.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace simforge::cli {

namespace {

void print_usage() {
    std::cout << "Usage: simforge <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  build-callback <file.c>   Compile a step callback and print its address\n"
              << "\n"
              << "Options:\n"
              << "  --alias a,b,...           Bind names to d->userdata[0], [1], ...\n"
              << "  --sim-root DIR            Simulation library installation\n"
              << "                            (default: $SIMFORGE_SIM_PATH)\n"
              << "  --keep-files              Keep generated sources and libraries\n"
              << "  --log-level=LEVEL         trace, debug, info, warn, error, off\n"
              << "  --log-filter=SPEC         e.g. build=debug,*=warn\n"
              << "  -v, -vv, -vvv, -q         Verbosity shortcuts\n"
              << "  -h, --help                Show this message\n"
              << "  -V, --version             Show version\n";
}

void print_version() {
    std::cout << "simforge " << VERSION << "\n";
}

std::vector<std::string> split_aliases(const std::string& list) {
    std::vector<std::string> aliases;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            aliases.push_back(item);
        }
    }
    return aliases;
}

int run_build_callback(const std::string& source_path, const std::vector<std::string>& aliases,
                       const std::string& sim_root) {
    std::ifstream in(source_path);
    if (!in) {
        std::cerr << "error: cannot read " << source_path << "\n";
        return 1;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    runtime::Installation installation;
    if (!sim_root.empty()) {
        installation = runtime::Installation::from_root(
            sim_root, util::env_or("SIMFORGE_SIM_LIBRARY", "simulation"),
            util::env_or("SIMFORGE_SIM_HEADER", "simulation.h"),
            util::env_or("SIMFORGE_SIM_KEY", ""));
    } else {
        auto resolved = runtime::Installation::from_environment();
        if (is_err(resolved)) {
            std::cerr << "error: " << unwrap_err(resolved) << "\n";
            return 1;
        }
        installation = unwrap(resolved);
    }

    auto result = build::build_callback_fn(buffer.str(), aliases, installation);
    if (is_err(result)) {
        const auto& err = unwrap_err(result);
        std::cerr << "error: " << err.describe() << "\n";
        return 1;
    }

    std::cout << "0x" << std::hex << unwrap(result) << std::dec << "\n";
    return 0;
}

} // namespace

int simforge_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    if (command == "build-callback") {
        std::string source_path;
        std::string sim_root;
        std::vector<std::string> aliases;

        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--alias" && i + 1 < argc) {
                auto more = split_aliases(argv[++i]);
                aliases.insert(aliases.end(), more.begin(), more.end());
            } else if (arg == "--sim-root" && i + 1 < argc) {
                sim_root = argv[++i];
            } else if (arg == "--keep-files") {
                RuntimeOptions::keep_build_files = true;
            } else if (arg == "--verbose" || arg == "-v" || arg == "-vv" || arg == "-vvv") {
                RuntimeOptions::verbose = true;
            } else if (arg.starts_with("-")) {
                // Logging flags, already read by parse_log_options
                continue;
            } else if (source_path.empty()) {
                source_path = arg;
            } else {
                std::cerr << "error: unexpected argument '" << arg << "'\n";
                return 1;
            }
        }

        if (source_path.empty()) {
            std::cerr << "Usage: simforge build-callback <file.c> [--alias a,b] "
                         "[--sim-root DIR] [--keep-files]\n";
            return 1;
        }
        return run_build_callback(source_path, aliases, sim_root);
    }

    std::cerr << "error: unknown command '" << command << "'\n";
    print_usage();
    return 1;
}

} // namespace simforge::cli

int main(int argc, char* argv[]) {
    return simforge::cli::simforge_main(argc, argv);
}
