#include "services/analysis/worker_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace dentescope::services {
namespace {

TEST(WorkerPoolTest, ZeroSelectsAtLeastOneWorker) {
    WorkerPool pool(0);
    EXPECT_GE(pool.size(), 1u);
}

TEST(WorkerPoolTest, ExplicitWorkerCount) {
    WorkerPool pool(3);
    EXPECT_EQ(pool.size(), 3u);
}

TEST(WorkerPoolTest, DestructionRunsQueuedTasks) {
    std::atomic<int> done{0};
    {
        WorkerPool pool(2);
        for (int i = 0; i < 20; ++i) {
            EXPECT_TRUE(pool.submit([&done] {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                ++done;
            }));
        }
    }
    EXPECT_EQ(done.load(), 20);
}

TEST(WorkerPoolTest, ThrowingTaskDoesNotStopWorker) {
    std::atomic<int> done{0};
    {
        WorkerPool pool(1);
        EXPECT_TRUE(pool.submit([] { throw std::runtime_error("task failure"); }));
        EXPECT_TRUE(pool.submit([&done] { ++done; }));
    }
    EXPECT_EQ(done.load(), 1);
}

TEST(WorkerPoolTest, TasksRunInParallel) {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    {
        WorkerPool pool(4);
        for (int i = 0; i < 4; ++i) {
            EXPECT_TRUE(pool.submit([&] {
                const int now = ++active;
                int seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                --active;
            }));
        }
    }
    EXPECT_GT(peak.load(), 1);
}

}  // anonymous namespace
}  // namespace dentescope::services
