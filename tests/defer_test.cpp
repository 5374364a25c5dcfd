// ============================================================================
// Defer Tests
// ============================================================================

#include "offload/core/defer.hpp"

#include "test_support.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <filesystem>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

using namespace offload;
using namespace offload::testing;

// ============================================================================
// Defer
// ============================================================================

TEST(DeferTest, RemovesHalfBuiltDirectoryOnFailure) {
    TempDir tmp;
    auto dir = tmp / "task";
    std::filesystem::create_directories(dir);

    auto submit = [&](bool spawn_ok) {
        Defer remove_dir([&] { std::filesystem::remove_all(dir); });
        if (!spawn_ok) return false;
        remove_dir.Dismiss();
        return true;
    };

    EXPECT_TRUE(submit(true));
    EXPECT_TRUE(std::filesystem::exists(dir));

    EXPECT_FALSE(submit(false));
    EXPECT_FALSE(std::filesystem::exists(dir));
}

TEST(DeferTest, RunsInReverseOrder) {
    std::string order;
    {
        Defer release([&] { order += "release,"; });
        Defer remove([&] { order += "remove,"; });
    }
    EXPECT_EQ(order, "remove,release,");
}

TEST(DeferTest, MovedFromDoesNotRun) {
    int cleanups = 0;
    {
        Defer first([&] { cleanups++; });
        Defer second(std::move(first));
    }
    EXPECT_EQ(cleanups, 1);
}

TEST(DeferTest, RunsWhenHandlerThrows) {
    bool cleaned = false;
    try {
        Defer cleanup([&] { cleaned = true; });
        throw std::runtime_error("handler threw");
    } catch (const std::runtime_error&) {
    }
    EXPECT_TRUE(cleaned);
}

// ============================================================================
// OFFLOAD_DEFER
// ============================================================================

TEST(DeferTest, ClosesDescriptor) {
    int fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    ASSERT_GE(fd, 0);
    {
        OFFLOAD_DEFER([&] { ::close(fd); });
        EXPECT_NE(::fcntl(fd, F_GETFD), -1);
    }
    EXPECT_EQ(::fcntl(fd, F_GETFD), -1);
}
