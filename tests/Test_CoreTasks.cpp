#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <thread>

import Core;

using namespace Core::Tasks;

TEST(CoreTasks, BasicDispatch)
{
    Scheduler::Initialize(2);

    std::atomic<int> counter = 0;

    for (int i = 0; i < 100; ++i)
    {
        Scheduler::Dispatch([&counter]()
        {
            counter++;
        });
    }

    Scheduler::WaitForAll();

    EXPECT_EQ(counter, 100);

    Scheduler::Shutdown();
}

TEST(CoreTasks, RunsInlineWithoutWorkers)
{
    ASSERT_FALSE(Scheduler::IsRunning());

    const std::thread::id caller = std::this_thread::get_id();
    std::thread::id ranOn;
    Scheduler::Dispatch([&ranOn]() { ranOn = std::this_thread::get_id(); });

    EXPECT_EQ(ranOn, caller);
    EXPECT_EQ(Scheduler::WorkerCount(), 0u);
}

TEST(CoreTasks, NestedDispatchCompletesBeforeWaitReturns)
{
    Scheduler::Initialize(2);

    std::atomic<int> counter = 0;
    for (int i = 0; i < 8; ++i)
    {
        Scheduler::Dispatch([&counter]()
        {
            Scheduler::Dispatch([&counter]() { counter++; });
            counter++;
        });
    }

    Scheduler::WaitForAll();
    EXPECT_EQ(counter, 16);

    Scheduler::Shutdown();
}

TEST(CoreTasks, ShutdownDrainsQueue)
{
    Scheduler::Initialize(1);

    std::atomic<int> counter = 0;
    for (int i = 0; i < 32; ++i)
        Scheduler::Dispatch([&counter]() { counter++; });

    Scheduler::Shutdown();
    EXPECT_EQ(counter, 32);
    EXPECT_FALSE(Scheduler::IsRunning());
}

TEST(CoreTasks, LocalTaskMoveTransfersPayload)
{
    auto shared = std::make_shared<int>(0);
    LocalTask task([shared]() { ++*shared; });
    ASSERT_TRUE(task.Valid());

    LocalTask moved(std::move(task));
    EXPECT_FALSE(task.Valid());
    ASSERT_TRUE(moved.Valid());

    moved();
    EXPECT_EQ(*shared, 1);
}
