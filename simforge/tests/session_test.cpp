//! # Session Tests
//!
//! Opens sessions over the fixture extension module, compiled at test time
//! with the system C compiler. The module is built with -fexceptions so a
//! SimulationWarning can unwind through its C frames.

#include "runtime/session.hpp"
#include "test_support.hpp"
#include "util/toolchain.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace simforge;
using namespace simforge::runtime;
using simforge::test::ScratchDir;

namespace {

using WarnFn = void (*)(const char*);
using IsActivatedFn = int (*)();

/// Loads an already-built library as the "module" without running anything.
class PrebuiltEnvironment : public module::ModuleBuildEnvironment {
public:
    PrebuiltEnvironment(std::string name, fs::path library)
        : name_(std::move(name)), library_(std::move(library)) {}

    util::ProcessResult run_build(int) override {
        util::ProcessResult result;
        result.launched = true;
        result.exit_code = 0;
        return result;
    }
    std::vector<fs::path> find_artifacts() override {
        return {library_};
    }
    Result<loader::LoadedArtifact*, build::BuildError> load(const fs::path& artifact) override {
        return loader::ArtifactLoader::global().load(name_, artifact);
    }
    void clean_workspace() override {}

private:
    std::string name_;
    fs::path library_;
};

} // namespace

class SessionTest : public ::testing::Test {
protected:
    SessionConfig make_config() {
        const std::string test_name =
            ::testing::UnitTest::GetInstance()->current_test_info()->name();

        SessionConfig config;
        config.installation = test::stub_installation();
        config.module.module_name = "simext_" + std::to_string(getpid()) + "_" + test_name;
        config.module.workspace_dir = scratch.path() / "build";
        config.module.artifact_dir = scratch.path() / "generated";
        config.module.artifact_extension = ".so";
        config.module.build_command = {util::find_c_compiler(),
                                       "-shared",
                                       "-fPIC",
                                       "-fexceptions",
                                       "-o",
                                       (scratch.path() / "generated" / "simext.so").string(),
                                       SIMFORGE_EXTMODULE_SOURCE};
        config.module.timeout_seconds = 60;
        config.callback_options.work_dir = scratch.path() / "callbacks";
        fs::create_directories(config.callback_options.work_dir);
        return config;
    }

    ScratchDir scratch{"session"};
};

TEST_F(SessionTest, PublishesModuleFunctions) {
    auto session = Session::open(make_config());

    const auto& functions = session->functions();
    EXPECT_TRUE(functions.contains("sim_add"));
    EXPECT_TRUE(functions.contains("sim_activate"));
    EXPECT_TRUE(functions.contains("sim_set_warning_handler"));
    EXPECT_FALSE(functions.contains("helper_scale"));

    using AddFn = int (*)(int, int);
    EXPECT_EQ(functions.get<AddFn>("sim_add")(1, 2), 3);
}

TEST_F(SessionTest, ActivatesWithKeyPath) {
    // The fixture has no key file; activation still runs
    auto session = Session::open(make_config());

    auto is_activated = session->functions().get<IsActivatedFn>("sim_is_activated");
    ASSERT_NE(is_activated, nullptr);
    EXPECT_EQ(is_activated(), 1);
}

TEST_F(SessionTest, WarningsRaiseThroughNativeCode) {
    auto session = Session::open(make_config());
    ASSERT_TRUE(session->warning_handler_installed());

    auto warn = session->functions().get<WarnFn>("sim_warning");
    ASSERT_NE(warn, nullptr);

    try {
        warn("Pre-allocated constraint buffer is full");
        FAIL() << "expected SimulationWarning";
    } catch (const warning::SimulationWarning& e) {
        EXPECT_NE(std::string(e.what()).find("njmax"), std::string::npos);
    }
}

TEST_F(SessionTest, IgnoreScopeSilencesModuleWarnings) {
    auto session = Session::open(make_config());
    auto warn = session->functions().get<WarnFn>("sim_warning");
    ASSERT_NE(warn, nullptr);

    {
        warning::IgnoreWarningsScope quiet(session->warnings());
        EXPECT_NO_THROW(warn("Unknown warning type"));
    }
    EXPECT_THROW(warn("Unknown warning type"), warning::SimulationWarning);
}

TEST_F(SessionTest, WarningsAfterCloseAreDropped) {
    auto session = Session::open(make_config());
    auto warn = session->functions().get<WarnFn>("sim_warning");
    ASSERT_NE(warn, nullptr);

    // The module stays loaded; its handler must no longer reach the channel
    session.reset();
    EXPECT_NO_THROW(warn("Unknown warning type"));
}

TEST_F(SessionTest, StrippedModulePublishesFunctions) {
    auto config = make_config();
    config.module.build_command.insert(config.module.build_command.begin() + 1, "-s");
    auto session = Session::open(std::move(config));

    EXPECT_TRUE(session->functions().contains("sim_add"));
    EXPECT_TRUE(session->warning_handler_installed());
}

TEST_F(SessionTest, BuildsCallbacks) {
    auto session = Session::open(make_config());

    auto result = session->build_callback("void fun(const Model* m, Data* d) { hits += 1; }",
                                          {"hits"});
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).describe();
    EXPECT_NE(unwrap(result), 0u);
    EXPECT_TRUE(fs::is_empty(scratch.path() / "callbacks"));
}

TEST_F(SessionTest, ModuleBuildFailureThrows) {
    auto config = make_config();
    config.module.build_command = {"sh", "-c", "exit 1"};
    config.module.max_attempts = 2;

    EXPECT_THROW(Session::open(std::move(config)), std::runtime_error);
}

TEST_F(SessionTest, ModuleWithoutHooks) {
    auto config = make_config();
    PrebuiltEnvironment env("simstub_session_" + std::to_string(getpid()),
                            SIMFORGE_SIMSTUB_LIB_PATH);

    auto session = Session::open(std::move(config), env);
    EXPECT_FALSE(session->warning_handler_installed());
    EXPECT_FALSE(session->activate());
    // simstub exports no _sim_* names
    EXPECT_EQ(session->functions().size(), 0u);
}
