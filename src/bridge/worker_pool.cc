#include "worker_pool.h"

#include <glog/logging.h>

#include "../common/errors.h"

namespace SalKafka {

WorkerPool::WorkerPool(size_t num_threads, std::string name) : name_(std::move(name)) {
    if (num_threads == 0) num_threads = 1;
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&WorkerPool::WorkerThread, this);
    }
    VLOG(1) << "Started " << name_ << " pool with " << num_threads << " threads";
}

WorkerPool::~WorkerPool() {
    Stop();
}

void WorkerPool::Submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw Error(name_ + " pool is stopped");
        }
        tasks_.emplace(std::move(task));
    }
    condition_.notify_one();
}

void WorkerPool::Stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::WorkerThread() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        task();
    }
}

} // namespace SalKafka
