#include "thread_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>

using namespace std::chrono_literals;

TEST(ThreadPool, RunsEveryTask)
{
    std::atomic<int> count{0};
    {
        ThreadPool pool(3);
        EXPECT_EQ(pool.size(), 3);
        for (int i = 0; i < 100; ++i)
            pool.submit([&count] { ++count; });
        pool.wait();
        EXPECT_EQ(count.load(), 100);
    }
}

TEST(ThreadPool, WaitRethrowsFirstTaskError)
{
    ThreadPool pool(1);
    pool.submit([] { throw std::runtime_error("tile failed"); });
    EXPECT_THROW(pool.wait(), std::runtime_error);

    // The error is consumed; the pool keeps working.
    std::atomic<int> count{0};
    pool.submit([&count] { ++count; });
    EXPECT_NO_THROW(pool.wait());
    EXPECT_EQ(count.load(), 1);
}

TEST(ThreadPool, DiscardQueuedLeavesRunningTaskAlone)
{
    std::mutex              mtx;
    std::condition_variable cv;
    bool                    started  = false;
    bool                    released = false;
    std::atomic<int>        ran{0};

    {
        ThreadPool pool(1);
        pool.submit([&] {
            std::unique_lock<std::mutex> lock(mtx);
            started = true;
            cv.notify_all();
            cv.wait(lock, [&] { return released; });
            ++ran;
        });
        {
            std::unique_lock<std::mutex> lock(mtx);
            ASSERT_TRUE(cv.wait_for(lock, 5s, [&] { return started; }));
        }
        pool.submit([&ran] { ran += 10; });
        pool.submit([&ran] { ran += 10; });

        EXPECT_EQ(pool.discard_queued(), 2);
        EXPECT_EQ(pool.discard_queued(), 0);
        {
            std::lock_guard<std::mutex> lock(mtx);
            released = true;
        }
        cv.notify_all();
        pool.wait();
    }
    EXPECT_EQ(ran.load(), 1);
}
