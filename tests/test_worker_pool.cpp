#include "meterstat/core/worker_pool.h"
#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>

namespace meterstat {
namespace test {

TEST(WorkerPoolTest, RunsAllTasks) {
    WorkerPool pool(4, "TestPool");
    EXPECT_EQ(pool.getThreadCount(), 4u);

    std::atomic<int> counter{0};
    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(pool.submitTask([&counter]() { counter.fetch_add(1); }));
    }
    pool.waitIdle();

    EXPECT_EQ(counter.load(), 100);
    EXPECT_EQ(pool.getCompletedCount(), 100u);
    EXPECT_EQ(pool.getQueueLength(), 0u);
}

TEST(WorkerPoolTest, DefaultThreadCount) {
    WorkerPool pool;
    EXPECT_GT(pool.getThreadCount(), 0u);
}

TEST(WorkerPoolTest, FailingTaskIsCounted) {
    WorkerPool pool(1, "TestPool");
    std::atomic<int> counter{0};

    pool.submitTask([]() { throw std::runtime_error("boom"); });
    pool.submitTask([&counter]() { counter.fetch_add(1); });
    pool.waitIdle();

    EXPECT_EQ(pool.getFailedCount(), 1u);
    EXPECT_EQ(pool.getCompletedCount(), 1u);
    EXPECT_EQ(counter.load(), 1);
}

TEST(WorkerPoolTest, ShutdownDrainsQueueAndRejectsNewTasks) {
    WorkerPool pool(1, "TestPool");
    std::atomic<int> counter{0};
    for (int i = 0; i < 10; ++i) {
        pool.submitTask([&counter]() { counter.fetch_add(1); });
    }
    pool.shutdown();

    EXPECT_EQ(counter.load(), 10);
    EXPECT_FALSE(pool.submitTask([]() {}));
    // second shutdown is harmless
    pool.shutdown();
}

}  // namespace test
}  // namespace meterstat
