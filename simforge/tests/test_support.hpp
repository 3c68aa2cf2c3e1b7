//! # Test Support
//!
//! Fixture installation and scratch directories shared by the test suites.
//! Paths come from compile definitions set in CMakeLists.txt.

#pragma once

#include "runtime/installation.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <unistd.h>

namespace simforge::test {

namespace fs = std::filesystem;

/// The stub simulation library built from tests/fixtures/simstub.
inline runtime::Installation stub_installation() {
    runtime::Installation inst;
    inst.root = SIMFORGE_SIMSTUB_DIR;
    inst.include_dir = fs::path(SIMFORGE_SIMSTUB_DIR) / "include";
    inst.library_dir = SIMFORGE_SIMSTUB_LIB_DIR;
    inst.library_name = "simulation";
    inst.header = "simulation.h";
    inst.key_path = inst.root / "key.txt";
    return inst;
}

/// A fresh directory under the system temp dir, removed on destruction.
class ScratchDir {
public:
    explicit ScratchDir(const std::string& tag) {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "simforge_" + tag + "_" + std::to_string(getpid());
        if (info) {
            name += std::string("_") + info->name();
        }
        path_ = fs::temp_directory_path() / name;
        std::error_code ec;
        fs::remove_all(path_, ec);
        fs::create_directories(path_);
    }

    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const fs::path& path() const {
        return path_;
    }

    /// Number of entries whose name starts with `prefix` (all if empty).
    size_t count(const std::string& prefix = {}) const {
        size_t n = 0;
        for (const auto& entry : fs::directory_iterator(path_)) {
            if (entry.path().filename().string().starts_with(prefix))
                ++n;
        }
        return n;
    }

    fs::path touch(const std::string& name, const std::string& content = "x") const {
        fs::path file = path_ / name;
        std::ofstream out(file);
        out << content;
        return file;
    }

private:
    fs::path path_;
};

/// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        const char* old = std::getenv(name);
        had_value_ = old != nullptr;
        if (had_value_)
            old_value_ = old;
        if (value)
            setenv(name, value, 1);
        else
            unsetenv(name);
    }

    ~ScopedEnv() {
        if (had_value_)
            setenv(name_.c_str(), old_value_.c_str(), 1);
        else
            unsetenv(name_.c_str());
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::string old_value_;
    bool had_value_ = false;
};

} // namespace simforge::test
