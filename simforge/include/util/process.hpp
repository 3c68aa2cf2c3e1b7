//! # Subprocess Runner
//!
//! Launches the C compiler, relink tools, and the extension module build
//! command. Combined stdout/stderr is captured so compiler diagnostics can be
//! attached to build errors.

#ifndef SIMFORGE_UTIL_PROCESS_HPP
#define SIMFORGE_UTIL_PROCESS_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace simforge::util {

/// Outcome of a finished (or killed) child process.
struct ProcessResult {
    bool launched = false;  ///< fork/exec succeeded
    bool timed_out = false; ///< killed after exceeding the time budget
    int exit_code = -1;     ///< exit status, -1 if signalled, not launched, or unreaped
    std::string output;     ///< combined stdout + stderr
    int64_t duration_us = 0;

    [[nodiscard]] bool success() const {
        return launched && !timed_out && exit_code == 0;
    }
};

/// Runs `argv[0]` (looked up in PATH) with the remaining arguments.
///
/// `timeout_seconds <= 0` waits for completion without a limit. On timeout the
/// child is sent SIGKILL and reaped before returning. If `waitpid` itself
/// fails (e.g. SIGCHLD is ignored), the result is neither a timeout nor a
/// success, and the error is appended to `output`.
ProcessResult run_process(const std::vector<std::string>& argv, int timeout_seconds = 0);

/// Renders an argv vector as a shell-like command line for logging.
std::string format_command(const std::vector<std::string>& argv);

} // namespace simforge::util

#endif // SIMFORGE_UTIL_PROCESS_HPP
