#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "filevault/thread_pool.hpp"
#include "test_helpers.hpp"

using namespace filevault;

TEST(ThreadPoolTest, RunsEveryPostedJob) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.getThreadCount(), 3u);

    std::mutex mutex;
    std::vector<int> squares(20, -1);
    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(pool.tryPost([i, &mutex, &squares] {
            std::lock_guard<std::mutex> lock(mutex);
            squares[i] = i * i;
        }));
    }

    pool.shutdown();
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(squares[i], i * i);
    }
}

TEST(ThreadPoolTest, ZeroThreadsStillRuns) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.getThreadCount(), 1u);

    std::promise<int> result;
    ASSERT_TRUE(pool.tryPost([&result] { result.set_value(7); }));
    EXPECT_EQ(result.get_future().get(), 7);
}

TEST(ThreadPoolTest, ShutdownDrainsQueuedWork) {
    std::atomic<int> completed{0};
    ThreadPool pool(1);

    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(pool.tryPost([&completed] {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            ++completed;
        }));
    }

    pool.shutdown();
    EXPECT_EQ(completed.load(), 10);
    EXPECT_EQ(pool.getQueueSize(), 0u);
}

TEST(ThreadPoolTest, RejectsWorkAfterShutdown) {
    ThreadPool pool(1);
    pool.shutdown();
    pool.shutdown();

    EXPECT_FALSE(pool.tryPost([] {}));
}

TEST(ThreadPoolTest, BoundedQueueRefusesOverflow) {
    ThreadPool pool(1, 2);
    EXPECT_EQ(pool.getMaxQueued(), 2u);

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::promise<void> started;

    ASSERT_TRUE(pool.tryPost([gate, &started] {
        started.set_value();
        gate.wait();
    }));
    // The worker now holds the first job, leaving the queue empty
    started.get_future().wait();

    EXPECT_TRUE(pool.tryPost([gate] { gate.wait(); }));
    EXPECT_TRUE(pool.tryPost([gate] { gate.wait(); }));
    EXPECT_FALSE(pool.tryPost([] {}));
    EXPECT_EQ(pool.getQueueSize(), 2u);
    EXPECT_EQ(pool.getActiveThreadCount(), 1u);

    release.set_value();
    pool.shutdown();
    EXPECT_EQ(pool.getQueueSize(), 0u);
}

TEST(ThreadPoolTest, WorkerSurvivesThrowingJob) {
    test::quietLogs();
    ThreadPool pool(1);

    ASSERT_TRUE(pool.tryPost([] { throw std::logic_error("bad job"); }));

    std::promise<int> after;
    ASSERT_TRUE(pool.tryPost([&after] { after.set_value(1); }));
    EXPECT_EQ(after.get_future().get(), 1);
    EXPECT_EQ(pool.getActiveThreadCount(), 0u);
}
