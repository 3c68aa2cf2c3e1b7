//! # Subprocess and Toolchain Tests

#include "test_support.hpp"
#include "util/process.hpp"
#include "util/toolchain.hpp"

#include <csignal>
#include <gtest/gtest.h>

using namespace simforge::util;
using simforge::test::ScopedEnv;

// ============================================================================
// run_process
// ============================================================================

TEST(RunProcessTest, CapturesStdoutAndStderr) {
    auto result = run_process({"sh", "-c", "echo out; echo err 1>&2"});

    EXPECT_TRUE(result.success());
    EXPECT_NE(result.output.find("out"), std::string::npos);
    EXPECT_NE(result.output.find("err"), std::string::npos);
}

TEST(RunProcessTest, ReportsExitCode) {
    auto result = run_process({"sh", "-c", "exit 3"});

    EXPECT_TRUE(result.launched);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.success());
}

TEST(RunProcessTest, MissingExecutable) {
    auto result = run_process({"simforge-no-such-tool-xyz"});

    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.exit_code, 127);
    EXPECT_NE(result.output.find("Failed to execute"), std::string::npos);
}

TEST(RunProcessTest, EmptyCommand) {
    auto result = run_process({});
    EXPECT_FALSE(result.launched);
    EXPECT_FALSE(result.success());
}

TEST(RunProcessTest, KillsOnTimeout) {
    auto result = run_process({"sleep", "10"}, 1);

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.success());
    // Killed well before the child would have finished
    EXPECT_LT(result.duration_us, 8'000'000);
}

TEST(RunProcessTest, LostExitStatusIsNotATimeout) {
    // With SIGCHLD ignored the kernel reaps the child and waitpid fails
    auto previous = std::signal(SIGCHLD, SIG_IGN);
    auto result = run_process({"true"}, 5);
    std::signal(SIGCHLD, previous);

    EXPECT_TRUE(result.launched);
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.success());
    EXPECT_NE(result.output.find("waitpid failed"), std::string::npos);
    EXPECT_LT(result.duration_us, 4'000'000);
}

TEST(RunProcessTest, LargeOutputDoesNotBlock) {
    // Well past the 64 KiB pipe buffer
    auto result = run_process({"sh", "-c", "i=0; while [ $i -lt 20000 ]; do "
                                           "echo 0123456789abcdef; i=$((i+1)); done"},
                              30);

    EXPECT_TRUE(result.success());
    EXPECT_GE(result.output.size(), 20000u * 17u);
}

TEST(FormatCommandTest, QuotesArgumentsWithSpaces) {
    EXPECT_EQ(format_command({"cc", "-o", "my lib.so", "a.c"}), "cc -o \"my lib.so\" a.c");
}

// ============================================================================
// Toolchain Discovery
// ============================================================================

TEST(ToolchainTest, CompilerFromSimforgeCc) {
    ScopedEnv cc("SIMFORGE_CC", "/opt/custom/bin/mycc");
    EXPECT_EQ(find_c_compiler(), "/opt/custom/bin/mycc");
}

TEST(ToolchainTest, SimforgeCcBeatsCc) {
    ScopedEnv a("SIMFORGE_CC", "first-cc");
    ScopedEnv b("CC", "second-cc");
    EXPECT_EQ(find_c_compiler(), "first-cc");
}

TEST(ToolchainTest, FallsBackToCcVariable) {
    ScopedEnv a("SIMFORGE_CC", nullptr);
    ScopedEnv b("CC", "second-cc");
    EXPECT_EQ(find_c_compiler(), "second-cc");
}

TEST(ToolchainTest, FindsShellInPath) {
    auto sh = find_in_path("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_EQ(sh->filename().string(), "sh");
}

TEST(ToolchainTest, MissingToolNotFound) {
    EXPECT_FALSE(find_in_path("simforge-no-such-tool-xyz").has_value());
}

TEST(ToolchainTest, EnvFlagValues) {
    const char* name = "SIMFORGE_TEST_FLAG";
    {
        ScopedEnv unset(name, nullptr);
        EXPECT_FALSE(env_flag(name));
    }
    for (const char* off : {"", "0", "false", "FALSE", "no", "off"}) {
        ScopedEnv e(name, off);
        EXPECT_FALSE(env_flag(name)) << off;
    }
    for (const char* on : {"1", "true", "yes", "anything"}) {
        ScopedEnv e(name, on);
        EXPECT_TRUE(env_flag(name)) << on;
    }
}
