#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace coderun {

// Fixed number of threads draining a FIFO queue.
// Once every worker is busy, new tasks wait in the queue, which bounds
// how many child processes exist at the same time.
class WorkerPool {
public:
    explicit WorkerPool(size_t worker_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Throws std::runtime_error after shutdown()
    template <typename F>
    std::future<std::invoke_result_t<F>> submit(F&& fn) {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw std::runtime_error("Worker pool is shut down");
            }
            tasks_.push([task]() { (*task)(); });
        }
        cv_.notify_one();
        return result;
    }

    // Finishes queued tasks, then joins every worker
    void shutdown();

    size_t worker_count() const { return workers_.size(); }
    size_t pending() const;
    size_t active() const { return active_.load(); }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    std::atomic<size_t> active_{0};
};

} // namespace coderun
