#pragma once

#include "agentgate/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentgate {

enum class EventType {
    // Request path
    RequestReceived,
    RequestAuthenticated,
    RequestRejected,
    RequestSucceeded,
    RequestFailed,
    ProviderAttemptFailed,
    ProviderShortCircuited,
    FallbackAdvanced,
    // Ledger
    ReservationCreated,
    ReservationCommitted,
    ReservationReleased,
    ReservationExpired,
    BudgetOverrun,
    BudgetSoftLimitReached,
    LedgerPersistenceFailed,
    // Breakers
    BreakerOpened,
    BreakerHalfOpened,
    BreakerClosed,
    // Tokens and credentials
    TokenMinted,
    TokenRotated,
    TokenRevoked,
    CredentialRegistered,
    VaultUnavailable,
    // Rate limiting and audit
    RateLimited,
    AuditEventDropped
};

const char* to_string(EventType t);

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    std::optional<AgentId> agent_id;
    std::optional<ProviderId> provider_id;
    std::optional<RequestId> request_id;
    std::optional<ReservationId> reservation_id;
    std::optional<Money> amount;
    std::optional<ResponseStatus> status;
    std::optional<BreakerState> breaker_state;

    // Operation duration in microseconds (e.g., end-to-end request latency)
    std::optional<double> duration_us;
};

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t total_requests{0};
        std::uint64_t succeeded_requests{0};
        std::uint64_t failed_requests{0};
        std::uint64_t rejected_auth{0};
        std::uint64_t rejected_budget{0};
        std::uint64_t rejected_rate_limit{0};
        std::uint64_t provider_attempt_failures{0};
        std::uint64_t fallback_advances{0};
        std::uint64_t breaker_opens{0};
        std::uint64_t budget_overruns{0};
        std::uint64_t reservations_expired{0};
        std::uint64_t audit_events_dropped{0};
        Money committed_spend{0};
        double average_latency_ms{0.0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;

    Metrics get_metrics() const;
    void reset_metrics();

    using AlertCallback = std::function<void(const std::string&)>;
    void set_breaker_open_alert(AlertCallback cb);
    void set_budget_overrun_alert(AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    AlertCallback breaker_open_cb_;
    AlertCallback overrun_cb_;

    std::uint64_t latency_sample_count_{0};
    double latency_sum_ms_{0.0};
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

inline MonitorEvent make_event(EventType type, std::string message = {}) {
    MonitorEvent event;
    event.type = type;
    event.message = std::move(message);
    return event;
}

// Stamps the event with the current time and forwards it if a monitor is
// attached.
inline void emit(const std::shared_ptr<Monitor>& monitor, MonitorEvent event) {
    if (!monitor) return;
    event.timestamp = Clock::now();
    monitor->on_event(event);
}

} // namespace agentgate
