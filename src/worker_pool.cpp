#include "worker_pool.h"

namespace coderun {

WorkerPool::WorkerPool(size_t worker_count) {
    if (worker_count == 0) {
        throw std::invalid_argument("Worker pool needs at least one worker");
    }
    workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void WorkerPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;  // stopping_ and nothing left to run
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        ++active_;
        task();  // packaged_task stores any exception in its future
        --active_;
    }
}

} // namespace coderun
