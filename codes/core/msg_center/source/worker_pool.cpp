// =============================================================================
//  HTTP Mock Server - MsgCenter Module
//  文件: worker_pool.cpp
//  描述: WorkerPool工作线程池类实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "msg_center/worker_pool.hpp"
#include "utils/logger.hpp"
#include <exception>

namespace http_mock_server {

WorkerPool::WorkerPool(size_t min_workers, size_t max_workers)
    : min_workers_(min_workers == 0 ? 1 : min_workers)
    , max_workers_(max_workers < min_workers_ ? min_workers_ : max_workers)
    , running_(false)
    , busy_(0)
    , idle_(0)
{}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load(std::memory_order_acquire)) {
        return;
    }

    running_.store(true, std::memory_order_release);
    workers_.reserve(max_workers_);
    for (size_t i = 0; i < min_workers_; ++i) {
        spawn_worker_locked();
    }
}

void WorkerPool::stop() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load(std::memory_order_acquire)) {
            return;
        }
        running_.store(false, std::memory_order_release);
        // 停止后不会再追加线程，可以在锁外join
        workers.swap(workers_);
    }

    // 唤醒所有工作线程（通知在锁外发送）
    task_cv_.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool WorkerPool::post_task(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load(std::memory_order_acquire)) {
            return false;
        }
        task_queue_.push(std::move(task));

        // 没有空闲线程时按需扩展
        if (idle_ < task_queue_.size() && workers_.size() < max_workers_) {
            spawn_worker_locked();
        }
    }
    task_cv_.notify_one();
    return true;
}

size_t WorkerPool::get_thread_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

void WorkerPool::spawn_worker_locked() {
    workers_.emplace_back(&WorkerPool::worker_thread, this);
    LOG_DEBUG("WorkerPool", "Worker thread spawned, total %zu/%zu",
              workers_.size(), max_workers_);
}

void WorkerPool::worker_thread() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(mutex_);

            ++idle_;
            // 等待任务或停止信号
            task_cv_.wait(lock, [this]() {
                return !task_queue_.empty() ||
                       !running_.load(std::memory_order_acquire);
            });
            --idle_;

            // 先取任务（即使已经停止，也要处理完队列中剩余的任务）
            if (task_queue_.empty()) {
                break;
            }
            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        // 执行任务（在锁外执行，避免阻塞其他线程）
        busy_.fetch_add(1, std::memory_order_acq_rel);
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("WorkerPool", "Task threw exception: %s", e.what());
        }
        busy_.fetch_sub(1, std::memory_order_acq_rel);
    }
}

} // namespace http_mock_server

// 文件结束
