#include <gtest/gtest.h>

#include "io/file_access.hpp"
#include "onova/lock_file.hpp"
#include "testing.hpp"

namespace onova {
namespace {

TEST(LockFileTest, SecondExclusiveAcquireFailsUntilRelease) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Sub("Onova.lock");

    auto first = LockFile::TryAcquire(path);
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->Held());
    EXPECT_TRUE(testutil::Exists(path));

    EXPECT_FALSE(LockFile::TryAcquire(path).has_value());

    first->Release();
    EXPECT_FALSE(first->Held());

    auto again = LockFile::TryAcquire(path);
    EXPECT_TRUE(again.has_value());
}

TEST(LockFileTest, DestructionReleases) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Sub("Onova.lock");

    {
        auto held = LockFile::TryAcquire(path);
        ASSERT_TRUE(held.has_value());
    }
    EXPECT_TRUE(LockFile::TryAcquire(path).has_value());
}

TEST(LockFileTest, MoveKeepsLockHeld) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Sub("Onova.lock");

    auto held = LockFile::TryAcquire(path);
    ASSERT_TRUE(held.has_value());
    LockFile moved = std::move(*held);
    held.reset();

    EXPECT_TRUE(moved.Held());
    EXPECT_EQ(moved.Path(), path);
    EXPECT_FALSE(LockFile::TryAcquire(path).has_value());
}

TEST(LockFileTest, SharedHoldersCoexistAndBlockExclusive) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Sub("app");
    ASSERT_TRUE(testutil::WriteTextFile(path, "binary"));

    auto a = LockFile::TryAcquireShared(path);
    auto b = LockFile::TryAcquireShared(path);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_FALSE(LockFile::TryAcquire(path).has_value());

    a.reset();
    b.reset();
    EXPECT_TRUE(LockFile::TryAcquire(path).has_value());
}

TEST(LockFileTest, SharedAcquireDoesNotCreateFile) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Sub("missing");

    EXPECT_FALSE(LockFile::TryAcquireShared(path).has_value());
    EXPECT_FALSE(testutil::Exists(path));
}

TEST(LockFileTest, HoldSharedUntilExitSurvivesScope) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Sub("MyApp.dll");
    ASSERT_TRUE(testutil::WriteTextFile(path, "il"));

    {
        EXPECT_TRUE(LockFile::HoldSharedUntilExit(path));
    }
    EXPECT_TRUE(LockFile::HoldSharedUntilExit(path));
    EXPECT_FALSE(LockFile::TryAcquire(path).has_value());
    EXPECT_FALSE(CheckWriteAccess(path));
    EXPECT_TRUE(LockFile::TryAcquireShared(path).has_value());
}

TEST(LockFileTest, HoldSharedUntilExitNeedsExistingFile) {
    testutil::TemporaryDirectory tmp;
    EXPECT_FALSE(LockFile::HoldSharedUntilExit(tmp.Sub("missing")));
    EXPECT_FALSE(testutil::Exists(tmp.Sub("missing")));
}

} // namespace
} // namespace onova
