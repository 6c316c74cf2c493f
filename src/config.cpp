#include "agentgate/config.hpp"
#include "agentgate/exceptions.hpp"

#include <cstdlib>
#include <string>

namespace agentgate {

namespace {

std::optional<std::string> get_env(const char* name) {
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') return std::nullopt;
    return std::string(v);
}

std::string to_lower(std::string s) {
    for (auto& c : s) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}

bool parse_bool(const char* name, const std::string& s) {
    const std::string v = to_lower(s);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw InvalidConfigException(std::string(name) + ": expected a boolean, got '" + s + "'");
}

std::uint64_t parse_uint(const char* name, const std::string& s) {
    std::size_t pos = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(s, &pos);
    } catch (const std::exception&) {
        throw InvalidConfigException(std::string(name) + ": expected an integer, got '" + s + "'");
    }
    if (pos != s.size() || s.front() == '-') {
        throw InvalidConfigException(std::string(name) + ": expected an integer, got '" + s + "'");
    }
    return value;
}

double parse_double(const char* name, const std::string& s) {
    std::size_t pos = 0;
    double value = 0.0;
    try {
        value = std::stod(s, &pos);
    } catch (const std::exception&) {
        throw InvalidConfigException(std::string(name) + ": expected a number, got '" + s + "'");
    }
    if (pos != s.size()) {
        throw InvalidConfigException(std::string(name) + ": expected a number, got '" + s + "'");
    }
    return value;
}

Duration parse_millis(const char* name, const std::string& s) {
    return std::chrono::milliseconds(static_cast<std::int64_t>(parse_uint(name, s)));
}

void overlay_uint32(const char* name, std::uint32_t& target) {
    if (auto v = get_env(name)) target = static_cast<std::uint32_t>(parse_uint(name, *v));
}

void overlay_size(const char* name, std::size_t& target) {
    if (auto v = get_env(name)) target = static_cast<std::size_t>(parse_uint(name, *v));
}

void overlay_millis(const char* name, Duration& target) {
    if (auto v = get_env(name)) target = parse_millis(name, *v);
}

void overlay_double(const char* name, double& target) {
    if (auto v = get_env(name)) target = parse_double(name, *v);
}

void overlay_bool(const char* name, bool& target) {
    if (auto v = get_env(name)) target = parse_bool(name, *v);
}

void overlay_string(const char* name, std::string& target) {
    if (auto v = get_env(name)) target = *v;
}

} // anonymous namespace

Config load_config_from_env(Config base) {
    Config cfg = std::move(base);

    overlay_size("AGENTGATE_WORKER_THREADS", cfg.worker_threads);
    overlay_size("AGENTGATE_IO_HEADROOM", cfg.io_headroom);
    overlay_size("AGENTGATE_MAX_PENDING_REQUESTS", cfg.max_pending_requests);
    overlay_millis("AGENTGATE_ATTEMPT_TIMEOUT_MS", cfg.attempt_timeout);

    if (auto v = get_env("AGENTGATE_VAULT_FAILURE_POLICY")) {
        auto p = to_lower(*v);
        if (p == "fail_closed" || p == "failclosed") {
            cfg.vault_failure_policy = VaultFailurePolicy::FailClosed;
        } else if (p == "try_next_candidate" || p == "trynextcandidate") {
            cfg.vault_failure_policy = VaultFailurePolicy::TryNextCandidate;
        } else {
            throw InvalidConfigException("AGENTGATE_VAULT_FAILURE_POLICY: unknown policy '" + *v + "'");
        }
    }

    // Tokens
    overlay_string("AGENTGATE_TOKEN_SIGNING_SECRET", cfg.tokens.signing_secret);
    overlay_string("AGENTGATE_TOKEN_PREFIX", cfg.tokens.token_prefix);
    overlay_millis("AGENTGATE_REVOCATION_CACHE_TTL_MS", cfg.tokens.revocation_cache_ttl);
    overlay_string("AGENTGATE_REQUIRED_SCOPE", cfg.tokens.required_scope);

    // Ledger
    overlay_double("AGENTGATE_SOFT_LIMIT_FRACTION", cfg.ledger.soft_limit_fraction);
    overlay_millis("AGENTGATE_RESERVATION_TTL_MS", cfg.ledger.reservation_ttl);
    overlay_millis("AGENTGATE_SWEEP_INTERVAL_MS", cfg.ledger.sweep_interval);
    overlay_millis("AGENTGATE_EXPIRED_RETENTION_MS", cfg.ledger.expired_retention);
    overlay_bool("AGENTGATE_ENABLE_EXPIRY_SWEEP", cfg.ledger.enable_expiry_sweep);

    // Breakers
    overlay_uint32("AGENTGATE_BREAKER_FAILURE_THRESHOLD", cfg.breaker.failure_threshold);
    overlay_millis("AGENTGATE_BREAKER_FAILURE_WINDOW_MS", cfg.breaker.failure_window);
    overlay_millis("AGENTGATE_BREAKER_COOLDOWN_MS", cfg.breaker.cooldown);

    // Rate limits
    overlay_bool("AGENTGATE_RATE_LIMIT_ENABLED", cfg.rate_limit.enabled);
    overlay_uint32("AGENTGATE_RATE_LIMIT_AGENT", cfg.rate_limit.per_agent.limit);
    overlay_millis("AGENTGATE_RATE_LIMIT_AGENT_WINDOW_MS", cfg.rate_limit.per_agent.window);
    overlay_uint32("AGENTGATE_RATE_LIMIT_ENDPOINT", cfg.rate_limit.per_endpoint.limit);
    overlay_millis("AGENTGATE_RATE_LIMIT_ENDPOINT_WINDOW_MS", cfg.rate_limit.per_endpoint.window);
    overlay_size("AGENTGATE_RATE_LIMIT_MAX_KEYS", cfg.rate_limit.max_tracked_keys);

    // Retry
    overlay_uint32("AGENTGATE_RETRY_MAX_ATTEMPTS", cfg.retry.max_attempts);
    overlay_millis("AGENTGATE_RETRY_BASE_DELAY_MS", cfg.retry.base_delay);
    overlay_double("AGENTGATE_RETRY_MULTIPLIER", cfg.retry.multiplier);
    overlay_millis("AGENTGATE_RETRY_MAX_DELAY_MS", cfg.retry.max_delay);
    overlay_double("AGENTGATE_RETRY_JITTER_MIN", cfg.retry.jitter_min);
    overlay_double("AGENTGATE_RETRY_JITTER_MAX", cfg.retry.jitter_max);

    // Audit
    overlay_size("AGENTGATE_AUDIT_QUEUE_CAPACITY", cfg.audit.queue_capacity);
    overlay_millis("AGENTGATE_AUDIT_DRAIN_INTERVAL_MS", cfg.audit.drain_interval);

    validate_config(cfg);
    return cfg;
}

void validate_config(const Config& config) {
    if (config.ledger.soft_limit_fraction <= 0.0 || config.ledger.soft_limit_fraction > 1.0) {
        throw InvalidConfigException("soft_limit_fraction must be in (0, 1]");
    }
    if (config.ledger.reservation_ttl <= Duration::zero()) {
        throw InvalidConfigException("reservation_ttl must be positive");
    }
    if (config.ledger.sweep_interval <= Duration::zero()) {
        throw InvalidConfigException("sweep_interval must be positive");
    }
    if (config.breaker.failure_threshold == 0) {
        throw InvalidConfigException("breaker failure_threshold must be at least 1");
    }
    if (config.breaker.cooldown < Duration::zero()) {
        throw InvalidConfigException("breaker cooldown must be non-negative");
    }
    if (config.rate_limit.enabled &&
        (config.rate_limit.per_agent.window <= Duration::zero() ||
         config.rate_limit.per_endpoint.window <= Duration::zero())) {
        throw InvalidConfigException("rate limit windows must be positive");
    }
    if (config.audit.queue_capacity == 0) {
        throw InvalidConfigException("audit queue_capacity must be at least 1");
    }
    if (config.attempt_timeout <= Duration::zero()) {
        throw InvalidConfigException("attempt_timeout must be positive");
    }
    if (config.ledger.reservation_ttl < config.attempt_timeout) {
        throw InvalidConfigException("reservation_ttl must be at least attempt_timeout");
    }
    if (config.tokens.token_prefix.empty() ||
        config.tokens.token_prefix.find('_') != std::string::npos) {
        throw InvalidConfigException("token_prefix must be non-empty and contain no '_'");
    }
    try {
        config.retry.validate();
    } catch (const std::invalid_argument& e) {
        throw InvalidConfigException(e.what());
    }
}

} // namespace agentgate
