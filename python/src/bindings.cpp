#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <agentgate/agentgate.hpp>

using namespace agentgate;

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_agentgate, m) {
    m.doc() = "AgentGate: budget-enforcing LLM gateway for autonomous agents";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_core(m);
    bind_monitors(m);
    bind_policies(m);
    bind_subsystems(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<ResponseStatus>(m, "ResponseStatus")
        .value("Ok",                      ResponseStatus::Ok)
        .value("Unauthenticated",         ResponseStatus::Unauthenticated)
        .value("Revoked",                 ResponseStatus::Revoked)
        .value("Forbidden",               ResponseStatus::Forbidden)
        .value("RateLimited",             ResponseStatus::RateLimited)
        .value("BudgetExceeded",          ResponseStatus::BudgetExceeded)
        .value("UnknownCapability",       ResponseStatus::UnknownCapability)
        .value("NoProviderBinding",       ResponseStatus::NoProviderBinding)
        .value("VaultUnavailable",        ResponseStatus::VaultUnavailable)
        .value("InvalidRequest",          ResponseStatus::InvalidRequest)
        .value("AllProvidersUnavailable", ResponseStatus::AllProvidersUnavailable)
        .value("Cancelled",               ResponseStatus::Cancelled)
        .value("DeadlineExceeded",        ResponseStatus::DeadlineExceeded)
        .export_values();

    py::enum_<BreakerState>(m, "BreakerState")
        .value("Closed",   BreakerState::Closed)
        .value("Open",     BreakerState::Open)
        .value("HalfOpen", BreakerState::HalfOpen)
        .export_values();

    py::enum_<ReservationState>(m, "ReservationState")
        .value("Pending",   ReservationState::Pending)
        .value("Committed", ReservationState::Committed)
        .value("Released",  ReservationState::Released)
        .value("Expired",   ReservationState::Expired)
        .export_values();

    py::enum_<ReserveStatus>(m, "ReserveStatus")
        .value("Reserved",       ReserveStatus::Reserved)
        .value("BudgetExceeded", ReserveStatus::BudgetExceeded)
        .value("UnknownAgent",   ReserveStatus::UnknownAgent)
        .value("InvalidAmount",  ReserveStatus::InvalidAmount)
        .export_values();

    py::enum_<SettleStatus>(m, "SettleStatus")
        .value("Committed",            SettleStatus::Committed)
        .value("CommittedAfterExpiry", SettleStatus::CommittedAfterExpiry)
        .value("Released",             SettleStatus::Released)
        .value("AlreadyResolved",      SettleStatus::AlreadyResolved)
        .value("UnknownReservation",   SettleStatus::UnknownReservation)
        .value("InvalidAmount",        SettleStatus::InvalidAmount)
        .export_values();

    py::enum_<ValidationStatus>(m, "ValidationStatus")
        .value("Valid",           ValidationStatus::Valid)
        .value("Unauthenticated", ValidationStatus::Unauthenticated)
        .value("Revoked",         ValidationStatus::Revoked)
        .export_values();

    py::enum_<VaultFailurePolicy>(m, "VaultFailurePolicy")
        .value("FailClosed",       VaultFailurePolicy::FailClosed)
        .value("TryNextCandidate", VaultFailurePolicy::TryNextCandidate)
        .export_values();

    py::enum_<EventType>(m, "EventType")
        .value("RequestReceived",         EventType::RequestReceived)
        .value("RequestAuthenticated",    EventType::RequestAuthenticated)
        .value("RequestRejected",         EventType::RequestRejected)
        .value("RequestSucceeded",        EventType::RequestSucceeded)
        .value("RequestFailed",           EventType::RequestFailed)
        .value("ProviderAttemptFailed",   EventType::ProviderAttemptFailed)
        .value("ProviderShortCircuited",  EventType::ProviderShortCircuited)
        .value("FallbackAdvanced",        EventType::FallbackAdvanced)
        .value("ReservationCreated",      EventType::ReservationCreated)
        .value("ReservationCommitted",    EventType::ReservationCommitted)
        .value("ReservationReleased",     EventType::ReservationReleased)
        .value("ReservationExpired",      EventType::ReservationExpired)
        .value("BudgetOverrun",           EventType::BudgetOverrun)
        .value("BudgetSoftLimitReached",  EventType::BudgetSoftLimitReached)
        .value("LedgerPersistenceFailed", EventType::LedgerPersistenceFailed)
        .value("BreakerOpened",           EventType::BreakerOpened)
        .value("BreakerHalfOpened",       EventType::BreakerHalfOpened)
        .value("BreakerClosed",           EventType::BreakerClosed)
        .value("TokenMinted",             EventType::TokenMinted)
        .value("TokenRotated",            EventType::TokenRotated)
        .value("TokenRevoked",            EventType::TokenRevoked)
        .value("CredentialRegistered",    EventType::CredentialRegistered)
        .value("VaultUnavailable",        EventType::VaultUnavailable)
        .value("RateLimited",             EventType::RateLimited)
        .value("AuditEventDropped",       EventType::AuditEventDropped)
        .export_values();

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    // ---- Config -----------------------------------------------------------

    py::class_<TokenConfig>(m, "TokenConfig")
        .def(py::init<>())
        .def_readwrite("signing_secret",       &TokenConfig::signing_secret)
        .def_readwrite("token_prefix",         &TokenConfig::token_prefix)
        .def_readwrite("revocation_cache_ttl", &TokenConfig::revocation_cache_ttl)
        .def_readwrite("required_scope",       &TokenConfig::required_scope);

    py::class_<LedgerConfig>(m, "LedgerConfig")
        .def(py::init<>())
        .def_readwrite("soft_limit_fraction", &LedgerConfig::soft_limit_fraction)
        .def_readwrite("reservation_ttl",     &LedgerConfig::reservation_ttl)
        .def_readwrite("sweep_interval",      &LedgerConfig::sweep_interval)
        .def_readwrite("expired_retention",   &LedgerConfig::expired_retention)
        .def_readwrite("enable_expiry_sweep", &LedgerConfig::enable_expiry_sweep);

    py::class_<BreakerConfig>(m, "BreakerConfig")
        .def(py::init<>())
        .def_readwrite("failure_threshold", &BreakerConfig::failure_threshold)
        .def_readwrite("failure_window",    &BreakerConfig::failure_window)
        .def_readwrite("cooldown",          &BreakerConfig::cooldown);

    py::class_<RateLimitRule>(m, "RateLimitRule")
        .def(py::init<>())
        .def_readwrite("limit",  &RateLimitRule::limit)
        .def_readwrite("window", &RateLimitRule::window);

    py::class_<RateLimitConfig>(m, "RateLimitConfig")
        .def(py::init<>())
        .def_readwrite("enabled",          &RateLimitConfig::enabled)
        .def_readwrite("per_agent",        &RateLimitConfig::per_agent)
        .def_readwrite("per_endpoint",     &RateLimitConfig::per_endpoint)
        .def_readwrite("max_tracked_keys", &RateLimitConfig::max_tracked_keys);

    py::class_<RetryPolicy>(m, "RetryPolicy")
        .def(py::init<>())
        .def_readwrite("max_attempts", &RetryPolicy::max_attempts)
        .def_readwrite("base_delay",   &RetryPolicy::base_delay)
        .def_readwrite("multiplier",   &RetryPolicy::multiplier)
        .def_readwrite("max_delay",    &RetryPolicy::max_delay)
        .def_readwrite("jitter_min",   &RetryPolicy::jitter_min)
        .def_readwrite("jitter_max",   &RetryPolicy::jitter_max)
        .def("nominal_delay", &RetryPolicy::nominal_delay, py::arg("failed_attempt"));

    py::class_<AuditConfig>(m, "AuditConfig")
        .def(py::init<>())
        .def_readwrite("queue_capacity", &AuditConfig::queue_capacity)
        .def_readwrite("drain_interval", &AuditConfig::drain_interval);

    py::class_<ModelPrice>(m, "ModelPrice")
        .def(py::init<>())
        .def_readwrite("input_per_million",  &ModelPrice::input_per_million)
        .def_readwrite("output_per_million", &ModelPrice::output_per_million)
        .def_readwrite("max_output_tokens",  &ModelPrice::max_output_tokens);

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("worker_threads",       &Config::worker_threads)
        .def_readwrite("io_headroom",          &Config::io_headroom)
        .def_readwrite("max_pending_requests", &Config::max_pending_requests)
        .def_readwrite("attempt_timeout",      &Config::attempt_timeout)
        .def_readwrite("vault_failure_policy", &Config::vault_failure_policy)
        .def_readwrite("default_price",        &Config::default_price)
        .def_readwrite("tokens",               &Config::tokens)
        .def_readwrite("ledger",               &Config::ledger)
        .def_readwrite("breaker",              &Config::breaker)
        .def_readwrite("rate_limit",           &Config::rate_limit)
        .def_readwrite("retry",                &Config::retry)
        .def_readwrite("audit",                &Config::audit);

    m.def("load_config_from_env", &load_config_from_env, py::arg("base") = Config{});
    m.def("validate_config", &validate_config, py::arg("config"));

    // ---- Value types ------------------------------------------------------

    py::class_<AgentIdentity>(m, "AgentIdentity")
        .def(py::init<>())
        .def_readwrite("agent_id", &AgentIdentity::agent_id)
        .def_readwrite("name",     &AgentIdentity::name)
        .def_readwrite("scopes",   &AgentIdentity::scopes)
        .def("has_scope", &AgentIdentity::has_scope, py::arg("scope"));

    py::class_<FallbackTier>(m, "FallbackTier")
        .def(py::init<>())
        .def_readwrite("provider_id",       &FallbackTier::provider_id)
        .def_readwrite("model",             &FallbackTier::model)
        .def_readwrite("preference_weight", &FallbackTier::preference_weight)
        .def_readwrite("quality_score",     &FallbackTier::quality_score);

    py::class_<TokenUsage>(m, "TokenUsage")
        .def(py::init<>())
        .def_readwrite("input_tokens",  &TokenUsage::input_tokens)
        .def_readwrite("output_tokens", &TokenUsage::output_tokens);

    py::class_<Reservation>(m, "Reservation")
        .def(py::init<>())
        .def_readwrite("id",         &Reservation::id)
        .def_readwrite("agent_id",   &Reservation::agent_id)
        .def_readwrite("amount",     &Reservation::amount)
        .def_readwrite("created_at", &Reservation::created_at)
        .def_readwrite("expires_at", &Reservation::expires_at)
        .def_readwrite("state",      &Reservation::state);

    py::class_<ReserveResult>(m, "ReserveResult")
        .def(py::init<>())
        .def_readwrite("status",      &ReserveResult::status)
        .def_readwrite("reservation", &ReserveResult::reservation)
        .def_readwrite("remaining",   &ReserveResult::remaining)
        .def("ok", &ReserveResult::ok);

    py::class_<SettleResult>(m, "SettleResult")
        .def(py::init<>())
        .def_readwrite("status",             &SettleResult::status)
        .def_readwrite("charged",            &SettleResult::charged)
        .def_readwrite("remaining",          &SettleResult::remaining)
        .def_readwrite("overrun",            &SettleResult::overrun)
        .def_readwrite("soft_limit_crossed", &SettleResult::soft_limit_crossed);

    py::class_<BudgetSnapshot>(m, "BudgetSnapshot")
        .def(py::init<>())
        .def_readwrite("agent_id",                 &BudgetSnapshot::agent_id)
        .def_readwrite("limit",                    &BudgetSnapshot::limit)
        .def_readwrite("spent",                    &BudgetSnapshot::spent)
        .def_readwrite("pending",                  &BudgetSnapshot::pending)
        .def_readwrite("outstanding_reservations", &BudgetSnapshot::outstanding_reservations)
        .def("remaining", &BudgetSnapshot::remaining);

    py::class_<ValidationResult>(m, "ValidationResult")
        .def(py::init<>())
        .def_readwrite("status",   &ValidationResult::status)
        .def_readwrite("identity", &ValidationResult::identity)
        .def_readwrite("reason",   &ValidationResult::reason)
        .def("ok", &ValidationResult::ok);

    py::class_<RateDecision>(m, "RateDecision")
        .def(py::init<>())
        .def_readwrite("allowed",     &RateDecision::allowed)
        .def_readwrite("retry_after", &RateDecision::retry_after);

    py::class_<BreakerPermit>(m, "BreakerPermit")
        .def(py::init<>())
        .def_readwrite("allowed",  &BreakerPermit::allowed)
        .def_readwrite("is_probe", &BreakerPermit::is_probe);

    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",           &MonitorEvent::type)
        .def_readwrite("timestamp",      &MonitorEvent::timestamp)
        .def_readwrite("message",        &MonitorEvent::message)
        .def_readwrite("agent_id",       &MonitorEvent::agent_id)
        .def_readwrite("provider_id",    &MonitorEvent::provider_id)
        .def_readwrite("request_id",     &MonitorEvent::request_id)
        .def_readwrite("reservation_id", &MonitorEvent::reservation_id)
        .def_readwrite("amount",         &MonitorEvent::amount)
        .def_readwrite("status",         &MonitorEvent::status)
        .def_readwrite("breaker_state",  &MonitorEvent::breaker_state)
        .def_readwrite("duration_us",    &MonitorEvent::duration_us);

    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("total_requests",            &MetricsMonitor::Metrics::total_requests)
        .def_readwrite("succeeded_requests",        &MetricsMonitor::Metrics::succeeded_requests)
        .def_readwrite("failed_requests",           &MetricsMonitor::Metrics::failed_requests)
        .def_readwrite("rejected_auth",             &MetricsMonitor::Metrics::rejected_auth)
        .def_readwrite("rejected_budget",           &MetricsMonitor::Metrics::rejected_budget)
        .def_readwrite("rejected_rate_limit",       &MetricsMonitor::Metrics::rejected_rate_limit)
        .def_readwrite("provider_attempt_failures", &MetricsMonitor::Metrics::provider_attempt_failures)
        .def_readwrite("fallback_advances",         &MetricsMonitor::Metrics::fallback_advances)
        .def_readwrite("breaker_opens",             &MetricsMonitor::Metrics::breaker_opens)
        .def_readwrite("budget_overruns",           &MetricsMonitor::Metrics::budget_overruns)
        .def_readwrite("reservations_expired",      &MetricsMonitor::Metrics::reservations_expired)
        .def_readwrite("audit_events_dropped",      &MetricsMonitor::Metrics::audit_events_dropped)
        .def_readwrite("committed_spend",           &MetricsMonitor::Metrics::committed_spend)
        .def_readwrite("average_latency_ms",        &MetricsMonitor::Metrics::average_latency_ms);

    // ---- Money helpers ----------------------------------------------------

    m.attr("MICROS_PER_USD") = MICROS_PER_USD;
    m.def("usd_to_micros", &usd_to_micros, py::arg("usd"));
    m.def("micros_to_usd", &micros_to_usd, py::arg("micros"));
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_AgentGateError =
        py::register_exception<AgentGateException>(m, "AgentGateError", PyExc_RuntimeError);

    static auto py_AgentNotFoundError =
        py::register_exception<AgentNotFoundException>(m, "AgentNotFoundError", py_AgentGateError.ptr());
    static auto py_AgentAlreadyRegisteredError =
        py::register_exception<AgentAlreadyRegisteredException>(m, "AgentAlreadyRegisteredError", py_AgentGateError.ptr());
    static auto py_ProviderNotFoundError =
        py::register_exception<ProviderNotFoundException>(m, "ProviderNotFoundError", py_AgentGateError.ptr());
    static auto py_InvalidRequestError =
        py::register_exception<InvalidRequestException>(m, "InvalidRequestError", py_AgentGateError.ptr());
    static auto py_InvalidConfigError =
        py::register_exception<InvalidConfigException>(m, "InvalidConfigError", py_AgentGateError.ptr());
    static auto py_CryptoError =
        py::register_exception<CryptoException>(m, "CryptoError", py_AgentGateError.ptr());
    static auto py_VaultUnavailableError =
        py::register_exception<VaultUnavailableException>(m, "VaultUnavailableError", py_AgentGateError.ptr());
    static auto py_LedgerStoreError =
        py::register_exception<LedgerStoreException>(m, "LedgerStoreError", py_AgentGateError.ptr());
    static auto py_AuditSinkError =
        py::register_exception<AuditSinkException>(m, "AuditSinkError", py_AgentGateError.ptr());
    static auto py_TransportError =
        py::register_exception<TransportException>(m, "TransportError", py_AgentGateError.ptr());
    static auto py_QueueFullError =
        py::register_exception<QueueFullException>(m, "QueueFullError", py_AgentGateError.ptr());
}
