#include "agentgate/audit.hpp"
#include "agentgate/exceptions.hpp"

#include <nlohmann/json.hpp>

namespace agentgate {

std::string to_json(const AuditEvent& event) {
    auto unix_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        event.timestamp.time_since_epoch()).count();

    nlohmann::json j = {
        {"kind", to_string(event.kind)},
        {"request_id", event.request_id},
        {"agent_id", event.agent_id},
        {"capability", event.capability},
        {"providers_attempted", event.providers_attempted},
        {"provider_id", event.provider_id},
        {"model", event.model},
        {"status", to_string(event.status)},
        {"estimated_cost_micros", event.estimated_cost},
        {"actual_cost_micros", event.actual_cost},
        {"input_tokens", event.usage.input_tokens},
        {"output_tokens", event.usage.output_tokens},
        {"attempts", event.attempts},
        {"latency_ms", event.latency_ms},
        {"timestamp_unix_ms", unix_ms},
    };
    return j.dump();
}

// ========== StreamAuditSink ==========

StreamAuditSink::StreamAuditSink(std::ostream& out)
    : out_(out) {}

void StreamAuditSink::publish(const AuditEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << to_json(event) << '\n';
    if (!out_) {
        throw AuditSinkException("Audit stream write failed");
    }
}

// ========== AuditDispatcher ==========

AuditDispatcher::AuditDispatcher(std::shared_ptr<AuditSink> sink, AuditConfig config)
    : sink_(std::move(sink))
    , config_(config)
{
    if (!sink_) {
        throw InvalidConfigException("AuditDispatcher requires a sink");
    }
    if (config_.queue_capacity == 0) {
        throw InvalidConfigException("Audit queue capacity must be at least 1");
    }
}

AuditDispatcher::~AuditDispatcher() {
    if (running_.load()) {
        stop();
    }
}

void AuditDispatcher::enqueue(AuditEvent event) {
    bool dropped = false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (queue_.size() >= config_.queue_capacity) {
            queue_.pop_front();
            dropped = true;
        }
        queue_.push_back(std::move(event));
    }
    queue_cv_.notify_one();

    if (dropped) {
        auto total = dropped_.fetch_add(1) + 1;
        emit(std::atomic_load(&monitor_), make_event(EventType::AuditEventDropped,
                                  "Audit queue full; dropped oldest (" +
                                  std::to_string(total) + " total)"));
    }
}

void AuditDispatcher::flush() {
    std::deque<AuditEvent> batch;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        batch.swap(queue_);
    }
    deliver(batch);
}

void AuditDispatcher::start() {
    if (running_.exchange(true)) {
        return;
    }
    drain_thread_ = std::thread(&AuditDispatcher::drain_loop, this);
}

void AuditDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_.store(false);
    }
    queue_cv_.notify_all();
    if (drain_thread_.joinable()) {
        drain_thread_.join();
    }
    flush();
}

bool AuditDispatcher::is_running() const noexcept {
    return running_.load();
}

std::size_t AuditDispatcher::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

std::uint64_t AuditDispatcher::dropped() const noexcept { return dropped_.load(); }
std::uint64_t AuditDispatcher::delivered() const noexcept { return delivered_.load(); }
std::uint64_t AuditDispatcher::failed() const noexcept { return failed_.load(); }

void AuditDispatcher::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::atomic_store(&monitor_, std::move(monitor));
}

void AuditDispatcher::drain_loop() {
    while (running_.load()) {
        std::deque<AuditEvent> batch;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait_for(lock, config_.drain_interval, [this] {
                return !queue_.empty() || !running_.load();
            });
            batch.swap(queue_);
        }
        deliver(batch);
    }
}

void AuditDispatcher::deliver(std::deque<AuditEvent>& batch) {
    if (batch.empty()) return;

    std::lock_guard<std::mutex> lock(publish_mutex_);
    for (auto& event : batch) {
        try {
            sink_->publish(event);
            delivered_.fetch_add(1);
        } catch (const AuditSinkException&) {
            // Delivery is best effort; failures are counted, never retried
            failed_.fetch_add(1);
        }
    }
}

} // namespace agentgate
