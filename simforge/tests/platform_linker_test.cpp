//! # Platform Linker Tests
//!
//! The relink flow is exercised with stand-in tools (`true`, `false`) so it
//! runs on every platform; only macOS uses it in the pipeline.

#include "build/platform_linker.hpp"
#include "test_support.hpp"

#include <fstream>
#include <gtest/gtest.h>

using namespace simforge;
using namespace simforge::build;
using simforge::test::ScratchDir;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream f(path);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

} // namespace

class PlatformLinkerTest : public ::testing::Test {
protected:
    ScratchDir dir{"link"};
    runtime::Installation inst =
        runtime::Installation::from_root("/opt/sim", "simulation", "simulation.h");
};

TEST_F(PlatformLinkerTest, RelinkOnlyOnMacOs) {
#ifdef __APPLE__
    EXPECT_TRUE(requires_relink());
#else
    EXPECT_FALSE(requires_relink());
#endif
}

TEST_F(PlatformLinkerTest, FinalPath) {
    EXPECT_EQ(PlatformLinker::final_path("/w/_fn_abc.dylib"), fs::path("/w/_fn_abc_final.dylib"));
}

TEST_F(PlatformLinkerTest, RewriteCommand) {
    PlatformLinker linker;
    auto argv = linker.rewrite_command(inst, "/w/out.dylib~");
    const std::string lib = inst.library_file_name();

    ASSERT_EQ(argv.size(), 5u);
    EXPECT_EQ(argv[0], "install_name_tool");
    EXPECT_EQ(argv[1], "-change");
    EXPECT_EQ(argv[2], "@executable_path/" + lib);
    EXPECT_EQ(argv[3], "/opt/sim/bin/" + lib);
    EXPECT_EQ(argv[4], "/w/out.dylib~");
}

TEST_F(PlatformLinkerTest, RelinkWritesFinalCopy) {
    auto artifact = dir.touch("_fn_abc.so", "library bytes");
    PlatformLinker linker("true");

    auto result = linker.relink(inst, artifact);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).describe();

    EXPECT_EQ(unwrap(result), dir.path() / "_fn_abc_final.so");
    EXPECT_EQ(read_file(unwrap(result)), "library bytes");
    // Original untouched, no temporary left
    EXPECT_TRUE(fs::exists(artifact));
    EXPECT_FALSE(fs::exists(dir.path() / "_fn_abc_final.so~"));
}

TEST_F(PlatformLinkerTest, RelinkInPlaceKeepsPath) {
    auto artifact = dir.touch("_fn_abc.so", "library bytes");

    auto result = relink_in_place(PlatformLinker("true"), inst, artifact);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).describe();

    EXPECT_EQ(unwrap(result), artifact);
    EXPECT_EQ(read_file(artifact), "library bytes");
    EXPECT_EQ(dir.count(), 1u);
}

TEST_F(PlatformLinkerTest, ToolFailureIsBuildError) {
    auto artifact = dir.touch("_fn_abc.so");

    auto result = relink_in_place(PlatformLinker("false"), inst, artifact);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, BuildError::Kind::Build);
    EXPECT_NE(unwrap_err(result).message.find("false"), std::string::npos);
    EXPECT_FALSE(fs::exists(dir.path() / "_fn_abc_final.so~"));
}

TEST_F(PlatformLinkerTest, MissingArtifactIsBuildError) {
    auto result = PlatformLinker("true").relink(inst, dir.path() / "_fn_missing.so");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, BuildError::Kind::Build);
}
