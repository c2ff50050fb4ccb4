/**
 * @file test_scratch_environment.cpp
 * @brief Unit tests for ScratchEnvironment provisioning and containment.
 * @author CodeVerdict contributors
 */

#include "sandbox/scratch_environment.hpp"

#include <gtest/gtest.h>
#include <unistd.h>
#include <filesystem>
#include <fstream>

using namespace code_verdict;

class ScratchEnvironmentTest : public ::testing::Test {
protected:
    std::filesystem::path root_;

    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() / ("cv_test_scratch_" + std::to_string(::getpid()));
        std::filesystem::remove_all(root_);
    }

    void TearDown() override {
        std::filesystem::remove_all(root_);
    }
};

TEST_F(ScratchEnvironmentTest, ProvisionCreatesPrivateDirectory) {
    auto scratch = ScratchEnvironment::provision(root_);
    ASSERT_TRUE(scratch.has_value()) << scratch.error().message;

    const auto& path = scratch->path();
    EXPECT_TRUE(std::filesystem::is_directory(path));
    EXPECT_TRUE(path.is_absolute());
    EXPECT_TRUE(std::filesystem::is_empty(path));

    auto perms = std::filesystem::status(path).permissions();
    EXPECT_EQ(perms & std::filesystem::perms::all, std::filesystem::perms::owner_all);
}

TEST_F(ScratchEnvironmentTest, EachProvisionIsDistinct) {
    auto first = ScratchEnvironment::provision(root_);
    auto second = ScratchEnvironment::provision(root_);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(first->path(), second->path());
}

TEST_F(ScratchEnvironmentTest, DestructionRemovesEverything) {
    std::filesystem::path path;
    {
        auto scratch = ScratchEnvironment::provision(root_);
        ASSERT_TRUE(scratch.has_value());
        path = scratch->path();
        std::filesystem::create_directories(path / "nested" / "deeper");
        std::ofstream(path / "nested" / "file.txt") << "data";
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(ScratchEnvironmentTest, DestructionRemovesLockedSubdirectories) {
    namespace fs = std::filesystem;
    fs::path path;
    {
        auto scratch = ScratchEnvironment::provision(root_);
        ASSERT_TRUE(scratch.has_value());
        path = scratch->path();
        fs::create_directories(path / "d" / "inner");
        std::ofstream(path / "d" / "file.txt") << "data";
        std::ofstream(path / "d" / "inner" / "deep.txt") << "data";
        fs::permissions(path / "d" / "inner", fs::perms::none);
        fs::permissions(path / "d", fs::perms::none);
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(ScratchEnvironmentTest, RemoveReportsSuccessAndReleasesOwnership) {
    auto scratch = ScratchEnvironment::provision(root_);
    ASSERT_TRUE(scratch.has_value());
    const auto path = scratch->path();
    std::filesystem::create_directory(path / "locked");
    std::filesystem::permissions(path / "locked", std::filesystem::perms::owner_write);

    auto removed = scratch->remove();
    ASSERT_TRUE(removed.has_value()) << removed.error().message;
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_TRUE(scratch->path().empty());
    EXPECT_TRUE(scratch->remove().has_value());
}

TEST_F(ScratchEnvironmentTest, RemoveDoesNotFollowSymlinkedDirectories) {
    namespace fs = std::filesystem;
    const auto outside = root_ / "outside";
    fs::create_directories(outside);
    fs::permissions(outside, fs::perms::owner_read | fs::perms::owner_exec);

    auto scratch = ScratchEnvironment::provision(root_);
    ASSERT_TRUE(scratch.has_value());
    fs::create_directory_symlink(outside, scratch->path() / "link");

    auto removed = scratch->remove();
    ASSERT_TRUE(removed.has_value()) << removed.error().message;
    EXPECT_TRUE(fs::exists(outside));
    EXPECT_EQ(fs::status(outside).permissions() & fs::perms::all,
              fs::perms::owner_read | fs::perms::owner_exec);
    fs::permissions(outside, fs::perms::owner_all);
}

TEST_F(ScratchEnvironmentTest, MovedFromOwnsNothing) {
    auto scratch = ScratchEnvironment::provision(root_);
    ASSERT_TRUE(scratch.has_value());
    const auto path = scratch->path();

    ScratchEnvironment moved = std::move(*scratch);
    scratch->teardown();
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(moved.path(), path);
}

TEST_F(ScratchEnvironmentTest, Contains) {
    auto scratch = ScratchEnvironment::provision(root_);
    ASSERT_TRUE(scratch.has_value());
    const auto& path = scratch->path();

    EXPECT_TRUE(scratch->contains(path));
    EXPECT_TRUE(scratch->contains(path / "new_file.txt"));
    EXPECT_TRUE(scratch->contains(path / "a" / ".." / "b.txt"));
    EXPECT_FALSE(scratch->contains(path / ".." / "escape.txt"));
    EXPECT_FALSE(scratch->contains("/etc/passwd"));
    EXPECT_FALSE(scratch->contains("relative.txt"));
}

TEST_F(ScratchEnvironmentTest, ContainsResolvesSymlinks) {
    auto scratch = ScratchEnvironment::provision(root_);
    ASSERT_TRUE(scratch.has_value());
    std::filesystem::create_directory_symlink("/tmp", scratch->path() / "link");
    EXPECT_FALSE(scratch->contains(scratch->path() / "link" / "outside.txt"));
}

TEST(PathIsWithinTest, ComponentWiseComparison) {
    EXPECT_TRUE(path_is_within("/a/b", "/a/b"));
    EXPECT_TRUE(path_is_within("/a/b", "/a/b/c"));
    EXPECT_TRUE(path_is_within("/a/b/", "/a/b/c"));
    EXPECT_FALSE(path_is_within("/a/b", "/a/bc"));
    EXPECT_FALSE(path_is_within("/a/b", "/a"));
}
