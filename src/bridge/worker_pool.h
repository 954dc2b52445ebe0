#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace SalKafka {

/**
 * Bounded pool of threads that host blocking client calls.
 * Threads are created once and reused for every task; tasks run in
 * submission order on a single-thread pool.
 */
class WorkerPool {
public:
    /**
     * @param num_threads Number of worker threads, at least 1
     * @param name Used in log messages
     */
    explicit WorkerPool(size_t num_threads = 1, std::string name = "worker");
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * Queue a task for execution on a worker thread
     * @throws Error if the pool has been stopped
     */
    void Submit(std::function<void()> task);

    // Finish queued tasks, then join every worker. Idempotent.
    void Stop();

    size_t size() const { return workers_.size(); }

private:
    void WorkerThread();

    std::string name_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_{false};
};

} // namespace SalKafka
