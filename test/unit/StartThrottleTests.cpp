/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    StartThrottleTests.cpp

Abstract:

    This file contains tests for the compute system start throttle.

--*/

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "StartThrottle.h"

using namespace std::chrono_literals;
using vmshim::hcs::StartThrottle;

namespace {

void RunStarts(StartThrottle& Throttle, int Count, std::atomic<int>& InProgress, std::atomic<int>& MaxInProgress)
{
    std::vector<std::thread> threads;
    for (int i = 0; i < Count; i++)
    {
        threads.emplace_back([&]() {
            const auto admission = Throttle.Admit();
            const auto current = ++InProgress;

            int observed = MaxInProgress.load();
            while (current > observed && !MaxInProgress.compare_exchange_weak(observed, current))
            {
            }

            std::this_thread::sleep_for(30ms);
            InProgress--;
        });
    }

    for (auto& thread : threads)
    {
        thread.join();
    }
}

TEST(StartThrottleTests, BoundsConcurrentStarts)
{
    StartThrottle throttle(2, 5ms);
    std::atomic<int> inProgress{0};
    std::atomic<int> maxInProgress{0};

    RunStarts(throttle, 8, inProgress, maxInProgress);

    EXPECT_LE(maxInProgress.load(), 2);
    EXPECT_GE(maxInProgress.load(), 1);
    EXPECT_EQ(throttle.InProgress(), 0);
}

TEST(StartThrottleTests, ZeroIsUnlimited)
{
    StartThrottle throttle(0, 5ms);
    std::atomic<int> inProgress{0};
    std::atomic<int> maxInProgress{0};

    RunStarts(throttle, 6, inProgress, maxInProgress);

    EXPECT_EQ(throttle.MaxParallel(), 0);
    EXPECT_EQ(throttle.InProgress(), 0);
    EXPECT_GT(maxInProgress.load(), 1);
}

TEST(StartThrottleTests, AdmissionReleasesOnScopeExit)
{
    StartThrottle throttle(1, 5ms);
    {
        const auto admission = throttle.Admit();
        EXPECT_EQ(throttle.InProgress(), 1);
    }

    EXPECT_EQ(throttle.InProgress(), 0);

    throttle.Acquire();
    EXPECT_EQ(throttle.InProgress(), 1);
    throttle.Release();
    throttle.Release();
    EXPECT_EQ(throttle.InProgress(), 0);
}

TEST(StartThrottleTests, WaiterIsAdmittedAfterRelease)
{
    StartThrottle throttle(1, 5ms);
    throttle.Acquire();

    std::atomic<bool> admitted{false};
    std::thread waiter([&]() {
        const auto admission = throttle.Admit();
        admitted = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(admitted.load());

    throttle.Release();
    waiter.join();
    EXPECT_TRUE(admitted.load());
    EXPECT_EQ(throttle.InProgress(), 0);
}

} // namespace
