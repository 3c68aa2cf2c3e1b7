//! # Build Identity Tests

#include "build/build_identity.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace simforge::build;

TEST(BuildIdentityTest, TokenShape) {
    auto id = BuildIdentity::next();
    const std::string& token = id.token();

    ASSERT_EQ(token.size(), BuildIdentity::TOKEN_LENGTH);
    EXPECT_EQ(token.rfind("_fn_", 0), 0u);
    EXPECT_TRUE(std::all_of(token.begin() + 4, token.end(),
                            [](char c) { return c >= 'a' && c <= 'z'; }))
        << token;
}

TEST(BuildIdentityTest, FromPartsEncodesBase26) {
    EXPECT_EQ(BuildIdentity::from_parts(0, 0).token(), "_fn_aaaaaaaaaaaaaaa");
    EXPECT_EQ(BuildIdentity::from_parts(0, 1).token(), "_fn_aaaaaaaaaaaaaab");
    EXPECT_EQ(BuildIdentity::from_parts(0, 26).token(), "_fn_aaaaaaaaaaaaaba");
    EXPECT_EQ(BuildIdentity::from_parts(1, 0).token(), "_fn_aaaaaabaaaaaaaa");
}

TEST(BuildIdentityTest, DistinctPidsNeverCollide) {
    std::set<std::string> tokens;
    for (uint64_t pid = 1000; pid < 1100; ++pid) {
        EXPECT_TRUE(tokens.insert(BuildIdentity::from_parts(pid, 5).token()).second);
    }
}

TEST(BuildIdentityTest, SuccessiveIdentitiesDiffer) {
    auto a = BuildIdentity::next();
    auto b = BuildIdentity::next();
    EXPECT_NE(a.token(), b.token());
}

TEST(BuildIdentityTest, PrefixInDirectory) {
    auto id = BuildIdentity::from_parts(7, 9);
    auto prefix = id.prefix_in("/tmp/work");
    EXPECT_EQ(prefix.parent_path(), std::filesystem::path("/tmp/work"));
    EXPECT_EQ(prefix.filename().string(), id.token());
}

TEST(BuildIdentityTest, UniqueAcrossThreads) {
    constexpr int num_threads = 8;
    constexpr int per_thread = 500;

    std::mutex mutex;
    std::set<std::string> tokens;
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&]() {
            std::vector<std::string> local;
            for (int i = 0; i < per_thread; ++i) {
                local.push_back(BuildIdentity::next().token());
            }
            std::lock_guard<std::mutex> lock(mutex);
            tokens.insert(local.begin(), local.end());
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(tokens.size(), static_cast<size_t>(num_threads * per_thread));
}
