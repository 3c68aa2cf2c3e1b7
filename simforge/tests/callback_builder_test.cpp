//! # Callback Build Pipeline Tests
//!
//! Real compile-load-cleanup runs against the stub simulation library, using
//! the system C compiler. Each test builds into its own scratch directory so
//! leftover files can be counted exactly.

#include "build/artifact_janitor.hpp"
#include "build/callback_builder.hpp"
#include "build/ephemeral_builder.hpp"
#include "common.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <simulation.h>
#include <thread>
#include <vector>

using namespace simforge;
using namespace simforge::build;
using simforge::test::ScopedEnv;
using simforge::test::ScratchDir;

namespace {

using CallbackFn = void (*)(const Model*, Data*);

const char* COUNTING_CALLBACK = R"(
void fun(const Model* m, Data* d) {
    steps += 1;
    version_sum += sim_version();
    last_time = d->time;
}
)";

} // namespace

class CallbackBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        RuntimeOptions::keep_build_files = false;
        options.work_dir = work.path();
    }

    Result<CallbackHandle, BuildError> build(const std::string& source,
                                             const std::vector<std::string>& aliases = {}) {
        return build_callback_fn(source, aliases, installation, options);
    }

    ScopedEnv debug{DEBUG_FN_BUILDER_ENV, nullptr};
    ScratchDir work{"callbacks"};
    runtime::Installation installation = test::stub_installation();
    CallbackBuildOptions options;
};

// ============================================================================
// EphemeralBuilder
// ============================================================================

TEST_F(CallbackBuilderTest, CompileCommandShape) {
    EphemeralBuilder builder(installation, "cc", work.path());
    auto argv = builder.compile_command(work.path() / "_fn_x.c", work.path() / "_fn_x.so");

    ASSERT_FALSE(argv.empty());
    EXPECT_EQ(argv.front(), "cc");
    EXPECT_EQ(argv.back(), "-lsimulation");
    auto has = [&](const std::string& arg) {
        return std::find(argv.begin(), argv.end(), arg) != argv.end();
    };
    EXPECT_TRUE(has("-shared"));
    EXPECT_TRUE(has("-fPIC"));
    EXPECT_TRUE(has("-I" + installation.include_dir.string()));
    EXPECT_TRUE(has("-L" + installation.library_dir.string()));
    EXPECT_TRUE(has((work.path() / "_fn_x.c").string()));
}

TEST_F(CallbackBuilderTest, BuilderLeavesArtifactForCaller) {
    EphemeralBuilder builder(installation, {}, work.path());
    auto result = builder.build("#include <stdint.h>\nint answer(void) { return 42; }\n");
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).describe();

    const auto& artifact = unwrap(result);
    EXPECT_TRUE(fs::exists(artifact.path));
    EXPECT_EQ(artifact.prefix.filename().string(), artifact.identity.token());
    EXPECT_EQ(artifact.path.parent_path(), work.path());

    EXPECT_GE(cleanup_build_files(artifact.prefix), 2u);
    EXPECT_EQ(work.count(), 0u);
}

TEST_F(CallbackBuilderTest, BuilderCleansUpOnCompilerFailure) {
    EphemeralBuilder builder(installation, "false", work.path());
    auto result = builder.build("int x;");

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, BuildError::Kind::Build);
    EXPECT_EQ(work.count(), 0u);
}

// ============================================================================
// End-to-End
// ============================================================================

TEST_F(CallbackBuilderTest, BuildsCallableCallback) {
    auto result = build(COUNTING_CALLBACK, {"steps", "version_sum", "last_time"});
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).describe();

    auto fn = reinterpret_cast<CallbackFn>(unwrap(result));
    ASSERT_NE(fn, nullptr);

    Model model{};
    model.timestep = 0.01;
    Data data{};
    data.time = 1.5;

    fn(&model, &data);
    fn(&model, &data);

    EXPECT_DOUBLE_EQ(data.userdata[0], 2.0);
    EXPECT_DOUBLE_EQ(data.userdata[1], 300.0);
    EXPECT_DOUBLE_EQ(data.userdata[2], 1.5);
}

TEST_F(CallbackBuilderTest, SuccessLeavesNoFiles) {
    auto result = build(COUNTING_CALLBACK, {"steps", "version_sum", "last_time"});
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).describe();

    EXPECT_EQ(work.count(BuildIdentity::PREFIX), 0u);
    EXPECT_EQ(work.count(), 0u);
}

TEST_F(CallbackBuilderTest, DebugSwitchKeepsFiles) {
    ScopedEnv keep(DEBUG_FN_BUILDER_ENV, "1");

    auto result = build(COUNTING_CALLBACK, {"steps", "version_sum", "last_time"});
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).describe();

    EXPECT_GE(work.count(BuildIdentity::PREFIX), 1u);
}

TEST_F(CallbackBuilderTest, CompilerErrorLeavesNoFiles) {
    auto result = build("void fun(const Model* m, Data* d) { this is not C; }");

    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    EXPECT_EQ(err.kind, BuildError::Kind::Build);
    EXPECT_FALSE(err.diagnostics.empty());
    EXPECT_EQ(work.count(), 0u);
}

TEST_F(CallbackBuilderTest, MissingFunLeavesNoFiles) {
    // The trailer references `fun`, so this fails at compile time too
    auto result = build("void not_fun(const Model* m, Data* d) {}");

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(work.count(), 0u);
}

TEST_F(CallbackBuilderTest, InvalidAliasCreatesNothing) {
    auto result = build(COUNTING_CALLBACK, {"steps", "steps"});

    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).message.find("duplicate"), std::string::npos);
    EXPECT_EQ(work.count(), 0u);
}

TEST_F(CallbackBuilderTest, MissingCompilerIsBuildError) {
    options.compiler = "simforge-no-such-cc";
    auto result = build(COUNTING_CALLBACK, {"steps", "version_sum", "last_time"});

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, BuildError::Kind::Build);
    EXPECT_EQ(work.count(), 0u);
}

TEST_F(CallbackBuilderTest, ConcurrentBuildsDoNotCollide) {
    constexpr int num_threads = 4;
    std::vector<CallbackHandle> handles(num_threads, 0);
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            std::string body = "void fun(const Model* m, Data* d) { out = " +
                               std::to_string(t + 1) + "; }";
            auto result = build(body, {"out"});
            if (is_ok(result)) {
                handles[t] = unwrap(result);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    Model model{};
    for (int t = 0; t < num_threads; ++t) {
        ASSERT_NE(handles[t], 0u) << "build " << t << " failed";
        Data data{};
        reinterpret_cast<CallbackFn>(handles[t])(&model, &data);
        EXPECT_DOUBLE_EQ(data.userdata[0], t + 1.0);
    }
    EXPECT_EQ(work.count(), 0u);
}
