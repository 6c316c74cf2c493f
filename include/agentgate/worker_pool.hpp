#pragma once

#include "agentgate/exceptions.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace agentgate {

// Fixed set of threads draining a bounded task queue.
// submit() throws QueueFullException instead of blocking when full.
class WorkerPool {
public:
    // thread_count == 0 means hardware_concurrency + io_headroom
    WorkerPool(std::size_t thread_count, std::size_t io_headroom, std::size_t max_pending);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
        auto future = task->get_future();
        enqueue([task] { (*task)(); });
        return future;
    }

    // Finishes queued tasks, then joins the threads
    void shutdown();

    std::size_t thread_count() const noexcept { return threads_.size(); }
    std::size_t pending() const;
    std::size_t max_pending() const noexcept { return max_pending_; }

private:
    std::size_t max_pending_;
    std::vector<std::thread> threads_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> tasks_;
    bool stopping_{false};

    void enqueue(std::function<void()> task);
    void worker_loop();
};

} // namespace agentgate
