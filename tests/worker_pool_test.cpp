// *****************************************************************************
// * This file is part of the S3Mirror project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The S3Mirror Authors - All Rights Reserved                  *
// *****************************************************************************

#include <atomic>
#include <future>
#include <gtest/gtest.h>
#include "base/worker_pool.h"

using namespace zen;
using namespace s3m;


TEST(WorkerPool, RunsAllTasks)
{
    std::atomic<int> done{0};

    WorkerPool pool(4, 0, Zstr("Test"));
    EXPECT_EQ(pool.getThreadCount(), 4u);

    for (int i = 0; i < 100; ++i)
        pool.run([&] { ++done; });

    pool.wait();
    EXPECT_EQ(done, 100);

    //pool is reusable after wait()
    for (int i = 0; i < 10; ++i)
        pool.run([&] { ++done; });
    pool.wait();
    EXPECT_EQ(done, 110);
}


TEST(WorkerPool, ConcurrencyIsBoundedByThreadCount)
{
    std::atomic<int> running{0};
    std::atomic<int> maxRunning{0};

    WorkerPool pool(3, 0, Zstr("Test"));
    for (int i = 0; i < 30; ++i)
        pool.run([&]
        {
            const int now = ++running;
            int prevMax = maxRunning;
            while (now > prevMax && !maxRunning.compare_exchange_weak(prevMax, now))
                ;
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            --running;
        });
    pool.wait();

    EXPECT_LE(maxRunning, 3);
    EXPECT_GE(maxRunning, 1);
}


TEST(WorkerPool, RunBlocksWhileAllWorkersAreBusy)
{
    std::promise<void> releaseFirst;
    std::promise<void> releaseSecond;
    std::shared_future<void> firstReleased  = releaseFirst .get_future().share();
    std::shared_future<void> secondReleased = releaseSecond.get_future().share();
    std::atomic<int> started{0};

    WorkerPool pool(2, 0 /*queueCapacity: hand-off only*/, Zstr("Test"));
    pool.run([&] { ++started; firstReleased .wait(); });
    pool.run([&] { ++started; secondReleased.wait(); });

    while (started < 2)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));

    std::atomic<bool> thirdAccepted{false};
    std::thread submitter([&]
    {
        pool.run([] {});
        thirdAccepted = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_FALSE(thirdAccepted); //no idle worker, no queue slot

    releaseFirst.set_value();
    submitter.join(); //returns once the first worker is idle again
    EXPECT_TRUE(thirdAccepted);

    releaseSecond.set_value();
    pool.wait();
}


TEST(WorkerPool, DestructorCompletesQueuedTasks)
{
    std::atomic<int> done{0};
    {
        WorkerPool pool(2, 50, Zstr("Test"));
        for (int i = 0; i < 40; ++i)
            pool.run([&]
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                ++done;
            });
    }
    EXPECT_EQ(done, 40);
}


TEST(WorkerPool, WaitWithoutTasksReturns)
{
    WorkerPool pool(1, 0, Zstr("Test"));
    pool.wait();
    SUCCEED();
}


TEST(WorkerPool, ZeroThreadsIsContractViolation)
{
    EXPECT_THROW(WorkerPool(0, 0, Zstr("Test")), std::logic_error);
}
