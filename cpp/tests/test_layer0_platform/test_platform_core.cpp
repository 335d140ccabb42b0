// tests/test_layer0_platform/test_platform_core.cpp
/**
 * @file test_platform_core.cpp
 * @brief Layer 0 tests for the platform helpers.
 */
#include "fed_platform.hpp"
#include "test_patterns.h"

#include <gtest/gtest.h>

#include <chrono>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace federator::platform;

class PlatformCoreTest : public federator::tests::PureApiTest
{
};

TEST_F(PlatformCoreTest, PidIsStableAndNonZero)
{
    EXPECT_NE(get_pid(), 0u);
    EXPECT_EQ(get_pid(), get_pid());
}

TEST_F(PlatformCoreTest, ThreadIdsDifferAcrossThreads)
{
    const uint64_t main_id = get_native_thread_id();
    uint64_t other_id = main_id;
    std::thread t([&]() { other_id = get_native_thread_id(); });
    t.join();
    EXPECT_NE(main_id, other_id);
}

TEST_F(PlatformCoreTest, ExecutableNameMatchesFullPath)
{
    const std::string name = get_executable_name(false);
    const std::string full = get_executable_name(true);
    ASSERT_FALSE(name.empty());
    EXPECT_NE(name.find("unknown"), 0u);
    EXPECT_GE(full.size(), name.size());
    EXPECT_EQ(full.substr(full.size() - name.size()), name);
}

TEST_F(PlatformCoreTest, MonotonicTimeAdvances)
{
    const uint64_t start = monotonic_time_ns();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_GE(elapsed_time_ns(start), 5'000'000u);
    EXPECT_EQ(elapsed_time_ns(monotonic_time_ns() + 1'000'000'000u), 0u);
}
