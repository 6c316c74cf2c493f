#include "agentgate/monitor.hpp"

#include <iomanip>
#include <iostream>

namespace agentgate {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::RequestReceived:         return "RequestReceived";
        case EventType::RequestAuthenticated:    return "RequestAuthenticated";
        case EventType::RequestRejected:         return "RequestRejected";
        case EventType::RequestSucceeded:        return "RequestSucceeded";
        case EventType::RequestFailed:           return "RequestFailed";
        case EventType::ProviderAttemptFailed:   return "ProviderAttemptFailed";
        case EventType::ProviderShortCircuited:  return "ProviderShortCircuited";
        case EventType::FallbackAdvanced:        return "FallbackAdvanced";
        case EventType::ReservationCreated:      return "ReservationCreated";
        case EventType::ReservationCommitted:    return "ReservationCommitted";
        case EventType::ReservationReleased:     return "ReservationReleased";
        case EventType::ReservationExpired:      return "ReservationExpired";
        case EventType::BudgetOverrun:           return "BudgetOverrun";
        case EventType::BudgetSoftLimitReached:  return "BudgetSoftLimitReached";
        case EventType::LedgerPersistenceFailed: return "LedgerPersistenceFailed";
        case EventType::BreakerOpened:           return "BreakerOpened";
        case EventType::BreakerHalfOpened:       return "BreakerHalfOpened";
        case EventType::BreakerClosed:           return "BreakerClosed";
        case EventType::TokenMinted:             return "TokenMinted";
        case EventType::TokenRotated:            return "TokenRotated";
        case EventType::TokenRevoked:            return "TokenRevoked";
        case EventType::CredentialRegistered:    return "CredentialRegistered";
        case EventType::VaultUnavailable:        return "VaultUnavailable";
        case EventType::RateLimited:             return "RateLimited";
        case EventType::AuditEventDropped:       return "AuditEventDropped";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::RequestRejected:
        case EventType::RequestFailed:
        case EventType::ReservationExpired:
        case EventType::BudgetOverrun:
        case EventType::BudgetSoftLimitReached:
        case EventType::LedgerPersistenceFailed:
        case EventType::BreakerOpened:
        case EventType::BreakerClosed:
        case EventType::TokenRotated:
        case EventType::TokenRevoked:
        case EventType::VaultUnavailable:
        case EventType::AuditEventDropped:
            return true;
        default:
            return false;
    }
}

bool is_request_path_event(EventType t) {
    switch (t) {
        case EventType::RequestReceived:
        case EventType::RequestAuthenticated:
        case EventType::ReservationCreated:
        case EventType::ReservationCommitted:
        case EventType::ReservationReleased:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;
    if (verbosity_ == Verbosity::Verbose && is_request_path_event(event.type)) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "[AgentGate] " << to_string(event.type);

    if (event.request_id.has_value()) {
        std::cout << " request=" << event.request_id.value();
    }
    if (event.agent_id.has_value()) {
        std::cout << " agent=" << event.agent_id.value();
    }
    if (event.provider_id.has_value()) {
        std::cout << " provider=" << event.provider_id.value();
    }
    if (event.reservation_id.has_value()) {
        std::cout << " reservation=" << event.reservation_id.value();
    }
    if (event.amount.has_value()) {
        std::cout << " amount=$" << std::fixed << std::setprecision(6)
                  << micros_to_usd(event.amount.value());
    }
    if (event.status.has_value()) {
        std::cout << " status=" << to_string(event.status.value());
    }
    if (event.breaker_state.has_value()) {
        std::cout << " breaker=" << to_string(event.breaker_state.value());
    }
    if (event.duration_us.has_value()) {
        std::cout << " took=" << std::fixed << std::setprecision(1)
                  << event.duration_us.value() / 1000.0 << "ms";
    }

    if (!event.message.empty()) {
        std::cout << " | " << event.message;
    }

    std::cout << "\n";
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    AlertCallback alert;
    std::string alert_message;

    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);

        switch (event.type) {
            case EventType::RequestReceived:
                metrics_.total_requests++;
                break;
            case EventType::RequestSucceeded:
                metrics_.succeeded_requests++;
                if (event.duration_us.has_value()) {
                    latency_sum_ms_ += event.duration_us.value() / 1000.0;
                    latency_sample_count_++;
                    metrics_.average_latency_ms = latency_sum_ms_ / latency_sample_count_;
                }
                break;
            case EventType::RequestFailed:
                metrics_.failed_requests++;
                break;
            case EventType::RequestRejected:
                if (event.status.has_value()) {
                    switch (event.status.value()) {
                        case ResponseStatus::Unauthenticated:
                        case ResponseStatus::Revoked:
                        case ResponseStatus::Forbidden:
                            metrics_.rejected_auth++;
                            break;
                        case ResponseStatus::BudgetExceeded:
                            metrics_.rejected_budget++;
                            break;
                        case ResponseStatus::RateLimited:
                            metrics_.rejected_rate_limit++;
                            break;
                        default:
                            break;
                    }
                }
                break;
            case EventType::ProviderAttemptFailed:
                metrics_.provider_attempt_failures++;
                break;
            case EventType::FallbackAdvanced:
                metrics_.fallback_advances++;
                break;
            case EventType::BreakerOpened:
                metrics_.breaker_opens++;
                if (breaker_open_cb_) {
                    alert = breaker_open_cb_;
                    alert_message = "Circuit breaker opened for " +
                                    event.provider_id.value_or("<unknown>");
                }
                break;
            case EventType::BudgetOverrun:
                metrics_.budget_overruns++;
                if (overrun_cb_) {
                    alert = overrun_cb_;
                    alert_message = "Budget overrun for agent " +
                                    event.agent_id.value_or("<unknown>");
                }
                break;
            case EventType::ReservationCommitted:
                metrics_.committed_spend += event.amount.value_or(0);
                break;
            case EventType::ReservationExpired:
                metrics_.reservations_expired++;
                break;
            case EventType::AuditEventDropped:
                metrics_.audit_events_dropped++;
                break;
            default:
                break;
        }
    }

    // Outside the lock: alert callbacks may call back into get_metrics()
    if (alert) {
        alert(alert_message);
    }
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
    latency_sample_count_ = 0;
    latency_sum_ms_ = 0.0;
}

void MetricsMonitor::set_breaker_open_alert(AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    breaker_open_cb_ = std::move(cb);
}

void MetricsMonitor::set_budget_overrun_alert(AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    overrun_cb_ = std::move(cb);
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    for (auto& m : monitors_) {
        m->on_event(event);
    }
}

} // namespace agentgate
