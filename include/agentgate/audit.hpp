#pragma once

#include "agentgate/types.hpp"
#include "agentgate/config.hpp"
#include "agentgate/monitor.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

namespace agentgate {

enum class AuditEventKind {
    Audit,      // one per completed request, whatever the outcome
    CostReport  // one per committed charge
};

struct AuditEvent {
    AuditEventKind kind{AuditEventKind::Audit};
    RequestId request_id{0};
    AgentId agent_id;
    Capability capability;
    std::vector<ProviderId> providers_attempted;
    ProviderId provider_id;   // provider that served the request, if any
    std::string model;
    ResponseStatus status{ResponseStatus::Ok};
    Money estimated_cost{0};
    Money actual_cost{0};
    TokenUsage usage;
    std::uint32_t attempts{0};
    double latency_ms{0.0};
    WallClock::time_point timestamp{};
};

// Single-line JSON rendering for sinks that write text
std::string to_json(const AuditEvent& event);

// Telemetry destination (produced). Implementations throw
// AuditSinkException when delivery fails.
class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void publish(const AuditEvent& event) = 0;
};

// Writes one JSON object per line
class StreamAuditSink : public AuditSink {
public:
    explicit StreamAuditSink(std::ostream& out);
    void publish(const AuditEvent& event) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

// Fire-and-forget delivery through a bounded queue.
// When full, the oldest queued event is dropped and counted.
class AuditDispatcher {
public:
    AuditDispatcher(std::shared_ptr<AuditSink> sink, AuditConfig config = AuditConfig{});
    ~AuditDispatcher();

    AuditDispatcher(const AuditDispatcher&) = delete;
    AuditDispatcher& operator=(const AuditDispatcher&) = delete;

    // Never blocks on the sink
    void enqueue(AuditEvent event);

    // Delivers everything queued on the calling thread
    void flush();

    void start();
    // Stops the drain thread and delivers what is still queued
    void stop();
    bool is_running() const noexcept;

    std::size_t pending() const;
    std::uint64_t dropped() const noexcept;
    std::uint64_t delivered() const noexcept;
    std::uint64_t failed() const noexcept;

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    std::shared_ptr<AuditSink> sink_;
    AuditConfig config_;
    std::shared_ptr<Monitor> monitor_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<AuditEvent> queue_;

    // Serialises sink calls between the drain thread and flush()
    std::mutex publish_mutex_;

    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> delivered_{0};
    std::atomic<std::uint64_t> failed_{0};

    std::thread drain_thread_;
    std::atomic<bool> running_{false};

    void drain_loop();
    void deliver(std::deque<AuditEvent>& batch);
};

inline const char* to_string(AuditEventKind k) {
    switch (k) {
        case AuditEventKind::Audit:      return "audit";
        case AuditEventKind::CostReport: return "cost_report";
    }
    return "unknown";
}

} // namespace agentgate
