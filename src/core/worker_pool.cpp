#include "meterstat/core/worker_pool.h"
#include <exception>
#include <iostream>

namespace meterstat {

WorkerPool::WorkerPool(size_t num_threads, const std::string& name)
    : name_(name),
      active_tasks_(0),
      stopping_(false),
      completed_(0),
      failed_(0) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) {
            num_threads = 2;
        }
    }
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this]() { workerLoop(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submitTask(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            return false;
        }
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

void WorkerPool::waitIdle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this]() {
        return task_queue_.empty() && active_tasks_ == 0;
    });
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t WorkerPool::getQueueLength() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return task_queue_.size();
}

void WorkerPool::workerLoop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() {
                return !task_queue_.empty() || stopping_;
            });

            if (task_queue_.empty()) {
                // stopping_ and nothing left to drain
                return;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
            ++active_tasks_;
        }

        try {
            task();
            completed_.fetch_add(1);
        } catch (const std::exception& e) {
            failed_.fetch_add(1);
            std::cerr << name_ << ": task failed: " << e.what() << std::endl;
        } catch (...) {
            failed_.fetch_add(1);
            std::cerr << name_ << ": task failed with unknown exception" << std::endl;
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --active_tasks_;
            if (task_queue_.empty() && active_tasks_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}

} // namespace meterstat
