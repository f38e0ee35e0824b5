// =============================================================================
//  HTTP Mock Server - MsgCenter Module
//  文件: worker_pool.hpp
//  描述: WorkerPool工作线程池类定义
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <vector>
#include <thread>
#include <functional>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <queue>

namespace http_mock_server {

/**
 * @brief 可伸缩工作线程池
 *
 * 启动时创建 min_workers 个线程；投递任务时若没有空闲线程且线程数未达上限，
 * 追加一个线程。连接任务会长时间占用线程（keep-alive），因此需要按需扩展。
 */
class WorkerPool {
public:
    /**
     * @brief 构造函数
     * @param min_workers 初始线程数量，默认2
     * @param max_workers 线程数量上限，小于min_workers时取min_workers
     */
    explicit WorkerPool(size_t min_workers = 2, size_t max_workers = 0);

    /**
     * @brief 析构函数
     */
    ~WorkerPool();

    // 禁止拷贝
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief 启动线程池
     */
    void start();

    /**
     * @brief 停止线程池，队列中剩余任务执行完毕后返回
     */
    void stop();

    /**
     * @brief 投递任务
     * @param task 要执行的任务函数
     * @return false线程池未运行，任务被丢弃
     */
    bool post_task(std::function<void()> task);

    /**
     * @brief 获取当前线程数
     */
    size_t get_thread_count() const;

    size_t get_max_threads() const { return max_workers_; }

    /**
     * @brief 正在执行任务的线程数
     */
    size_t get_busy_count() const { return busy_.load(std::memory_order_acquire); }

private:
    /**
     * @brief 工作线程函数
     */
    void worker_thread();

    // 调用方持有mutex_
    void spawn_worker_locked();

    size_t min_workers_;
    size_t max_workers_;
    std::vector<std::thread> workers_;

    // 任务队列：std::queue + mutex（MPMC线程安全）
    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex mutex_;
    std::condition_variable task_cv_;

    std::atomic<bool> running_;
    std::atomic<size_t> busy_;
    size_t idle_;                   // 等待任务的线程数，mutex_保护
};

} // namespace http_mock_server

// 文件结束
