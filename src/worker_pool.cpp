#include "agentgate/worker_pool.hpp"

#include <algorithm>

namespace agentgate {

WorkerPool::WorkerPool(std::size_t thread_count, std::size_t io_headroom, std::size_t max_pending)
    : max_pending_(max_pending)
{
    if (max_pending_ == 0) {
        throw InvalidConfigException("Worker pool queue must hold at least one task");
    }
    if (thread_count == 0) {
        // Provider calls block on I/O, so run a few more threads than cores
        thread_count = std::max<std::size_t>(std::thread::hardware_concurrency(), 1) + io_headroom;
    }

    threads_.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && threads_.empty()) return;
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

std::size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void WorkerPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw AgentGateException("Worker pool is shut down");
        }
        if (tasks_.size() >= max_pending_) {
            throw QueueFullException();
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void WorkerPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        // packaged_task stores any exception in the future
        task();
    }
}

} // namespace agentgate
