//! # Subprocess Runner
//!
//! fork/exec with a single pipe for stdout and stderr. The parent drains the
//! pipe while polling `waitpid(WNOHANG)`, so verbose compiler output cannot
//! fill the pipe buffer and stall the child.

#include "util/process.hpp"

#include "log/log.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace simforge::util {

std::string format_command(const std::vector<std::string>& argv) {
    std::string cmd;
    for (const auto& arg : argv) {
        if (!cmd.empty())
            cmd += ' ';
        if (arg.find(' ') != std::string::npos) {
            cmd += "\"" + arg + "\"";
        } else {
            cmd += arg;
        }
    }
    return cmd;
}

static void drain(int fd, std::string& out) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
}

ProcessResult run_process(const std::vector<std::string>& argv, int timeout_seconds) {
    using Clock = std::chrono::steady_clock;
    auto start = Clock::now();

    ProcessResult result;
    if (argv.empty()) {
        result.output = "Empty command";
        return result;
    }

    SIMFORGE_LOG_DEBUG("process", "exec: " << format_command(argv));

    // Children forked by other threads must not inherit our pipe. dup2 in our
    // own child clears close-on-exec on its stdout/stderr.
    int out_pipe[2];
#ifdef __linux__
    int pipe_ret = pipe2(out_pipe, O_CLOEXEC);
#else
    int pipe_ret = pipe(out_pipe);
    if (pipe_ret == 0) {
        fcntl(out_pipe[0], F_SETFD, FD_CLOEXEC);
        fcntl(out_pipe[1], F_SETFD, FD_CLOEXEC);
    }
#endif
    if (pipe_ret != 0) {
        result.output = "Failed to create pipe";
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.output = "Failed to fork";
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        close(out_pipe[0]);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        close(out_pipe[1]);

        std::vector<char*> c_args;
        c_args.reserve(argv.size() + 1);
        for (const auto& a : argv) {
            c_args.push_back(const_cast<char*>(a.c_str()));
        }
        c_args.push_back(nullptr);

        execvp(c_args[0], c_args.data());
        _exit(127);
    }

    result.launched = true;
    close(out_pipe[1]);
    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);

    auto deadline = Clock::now() + std::chrono::seconds(timeout_seconds);
    int status = 0;
    bool finished = false;
    int wait_errno = 0;

    while (true) {
        drain(out_pipe[0], result.output);

        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret > 0) {
            finished = true;
            break;
        }
        if (ret < 0 && errno != EINTR) {
            // ECHILD when SIGCHLD is ignored: the child was reaped for us
            wait_errno = errno;
            break;
        }
        if (timeout_seconds > 0 && Clock::now() >= deadline) {
            break;
        }
        usleep(1000);
    }

    if (wait_errno != 0) {
        result.exit_code = -1;
        result.output += "waitpid failed: ";
        result.output += std::strerror(wait_errno);
        SIMFORGE_LOG_WARN("process", "Lost exit status of '" << argv[0]
                                                             << "': " << std::strerror(wait_errno));
    } else if (!finished) {
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        result.timed_out = true;
        result.exit_code = -1;
        SIMFORGE_LOG_WARN("process", "Killed '" << argv[0] << "' after " << timeout_seconds
                                                << "s time budget");
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        if (result.exit_code == 127 && result.output.empty()) {
            result.output = "Failed to execute '" + argv[0] + "'";
        }
    } else {
        result.exit_code = -1;
    }

    // Non-blocking: a killed build may leave grandchildren holding the pipe
    drain(out_pipe[0], result.output);
    close(out_pipe[0]);

    result.duration_us =
        std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count();
    return result;
}

} // namespace simforge::util
