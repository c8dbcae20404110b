#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace meterstat {

/**
 * @brief Fixed-size thread pool for ingestion runs
 *
 * Tasks run in submission order on the first free worker. A task that throws
 * is logged and counted; the worker keeps going.
 */
class WorkerPool {
public:
    /**
     * @param num_threads Number of workers (0 = hardware concurrency)
     * @param name Name used in log lines
     */
    explicit WorkerPool(size_t num_threads = 0, const std::string& name = "WorkerPool");
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Submit a task to the pool
     * @param task Callable to execute (void() signature)
     * @return true if task was enqueued, false after shutdown()
     */
    bool submitTask(std::function<void()> task);

    /**
     * @brief Block until the queue is empty and no task is running
     */
    void waitIdle();

    /**
     * @brief Stop accepting tasks, finish queued ones and join the workers
     */
    void shutdown();

    size_t getThreadCount() const { return workers_.size(); }
    size_t getQueueLength() const;
    uint64_t getCompletedCount() const { return completed_.load(); }
    uint64_t getFailedCount() const { return failed_.load(); }

private:
    void workerLoop();

    std::string name_;
    std::vector<std::thread> workers_;

    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    size_t active_tasks_;
    bool stopping_;

    std::atomic<uint64_t> completed_;
    std::atomic<uint64_t> failed_;
};

} // namespace meterstat
