// =============================================================================
//  HTTP Mock Server - MsgCenter Module
//  文件: test_worker_pool.cpp
//  描述: WorkerPool单元测试
//  版权: Copyright (c) 2026
// =============================================================================
#include <gtest/gtest.h>
#include "msg_center/worker_pool.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace http_mock_server {
namespace test {

class WorkerPoolTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// 正常场景：WorkerPool执行任务
TEST_F(WorkerPoolTest, ExecuteTask) {
    WorkerPool pool(2);
    std::atomic<int> count{0};

    pool.start();
    EXPECT_EQ(pool.get_thread_count(), 2u);

    EXPECT_TRUE(pool.post_task([&count]() {
        count++;
    }));

    pool.stop();

    EXPECT_EQ(count.load(), 1);
}

// 异常场景：任务函数抛异常不影响后续任务
TEST_F(WorkerPoolTest, TaskThrowsException) {
    WorkerPool pool(1);
    std::atomic<int> count{0};

    pool.start();

    pool.post_task([]() {
        throw std::runtime_error("Test exception");
    });
    pool.post_task([&count]() {
        count++;
    });

    pool.stop();

    EXPECT_EQ(count.load(), 1);
}

// 边界场景：未运行时投递任务被拒绝
TEST_F(WorkerPoolTest, PostBeforeStartRejected) {
    WorkerPool pool(1);
    EXPECT_FALSE(pool.post_task([]() {}));

    pool.start();
    pool.stop();
    EXPECT_FALSE(pool.post_task([]() {}));
}

// 边界场景：stop()可靠唤醒空闲工作线程
TEST_F(WorkerPoolTest, StopWithoutTasks) {
    WorkerPool pool(2);

    pool.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    pool.stop();

    // 重复stop为空操作
    pool.stop();
    SUCCEED();
}

// stop()时队列中所有任务都被处理
TEST_F(WorkerPoolTest, ProcessAllTasksOnStop) {
    WorkerPool pool(1);  // 单线程，确保任务排队
    const int task_count = 10;
    std::atomic<int> executed_count{0};

    pool.start();

    for (int i = 0; i < task_count; ++i) {
        pool.post_task([&executed_count]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            executed_count++;
        });
    }

    pool.stop();

    EXPECT_EQ(executed_count.load(), task_count);
}

// 所有线程被长任务占用时按需扩展，直到上限
TEST_F(WorkerPoolTest, GrowsWhenAllWorkersBusy) {
    WorkerPool pool(1, 3);
    std::mutex mutex;
    std::condition_variable cv;
    bool release = false;
    std::atomic<int> started{0};

    pool.start();

    auto blocking_task = [&]() {
        started++;
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [&release]() { return release; });
    };

    for (int i = 0; i < 3; ++i) {
        pool.post_task(blocking_task);
    }

    // 三个任务应同时在执行
    for (int i = 0; i < 200 && started.load() < 3; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(started.load(), 3);
    EXPECT_EQ(pool.get_thread_count(), 3u);
    EXPECT_EQ(pool.get_busy_count(), 3u);

    // 达到上限后任务排队
    std::atomic<bool> queued_ran{false};
    pool.post_task([&queued_ran]() { queued_ran.store(true); });
    EXPECT_EQ(pool.get_thread_count(), 3u);

    {
        std::lock_guard<std::mutex> lock(mutex);
        release = true;
    }
    cv.notify_all();
    pool.stop();

    EXPECT_TRUE(queued_ran.load());
}

TEST_F(WorkerPoolTest, MaxBelowMinIsClamped) {
    WorkerPool pool(4, 1);
    EXPECT_EQ(pool.get_max_threads(), 4u);
}

} // namespace test
} // namespace http_mock_server

// 文件结束
