#pragma once

#include "agentgate/types.hpp"
#include "agentgate/retry_policy.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace agentgate {

// Token minting and validation
struct TokenConfig {
    // HMAC key for token signatures; must be non-empty before minting
    std::string signing_secret;

    // Tokens look like "<prefix>_<payload>.<signature>"
    std::string token_prefix = "agk";

    // How long a store lookup result may be served from the cache
    Duration revocation_cache_ttl = std::chrono::seconds(5);

    // Scope an identity must carry to make inference calls
    std::string required_scope = "llm:call";
};

// Budget ledger behaviour
struct LedgerConfig {
    // Emit BudgetSoftLimitReached when spend crosses this fraction of the limit
    double soft_limit_fraction = 0.9;

    // Lifetime of an unresolved reservation before the sweeper releases it
    Duration reservation_ttl = std::chrono::minutes(5);

    // How often the sweeper checks for expired reservations
    Duration sweep_interval = std::chrono::seconds(1);

    // How long expired records are kept to accept late commits
    Duration expired_retention = std::chrono::minutes(10);

    bool enable_expiry_sweep = true;
};

// Circuit breaker thresholds (per dependency; overridable per dependency)
struct BreakerConfig {
    std::uint32_t failure_threshold = 5;
    Duration failure_window = std::chrono::seconds(60);
    Duration cooldown = std::chrono::seconds(30);
};

struct RateLimitRule {
    std::uint32_t limit = 60;
    Duration window = std::chrono::minutes(1);
};

struct RateLimitConfig {
    bool enabled = true;
    RateLimitRule per_agent{60, std::chrono::minutes(1)};
    RateLimitRule per_endpoint{600, std::chrono::minutes(1)};

    // Idle keys are pruned when the table grows beyond this
    std::size_t max_tracked_keys = 100000;
};

// Fire-and-forget audit/cost emission
struct AuditConfig {
    std::size_t queue_capacity = 4096;
    Duration drain_interval = std::chrono::milliseconds(50);
};

// What to do when the credential vault cannot be reached
enum class VaultFailurePolicy {
    FailClosed,       // Terminate the request with VaultUnavailable
    TryNextCandidate  // Skip this provider and advance the fallback chain
};

// Per-model price used when the pricing table has no entry
struct ModelPrice {
    Money input_per_million{0};
    Money output_per_million{0};
    std::uint32_t max_output_tokens{4096};
};

struct Config {
    // Worker threads for submit(); 0 = hardware_concurrency + io_headroom
    std::size_t worker_threads = 0;
    std::size_t io_headroom = 4;

    // Requests waiting for a worker before submit() throws QueueFullException
    std::size_t max_pending_requests = 10000;

    // Timeout for a single provider attempt
    Duration attempt_timeout = std::chrono::seconds(30);

    VaultFailurePolicy vault_failure_policy = VaultFailurePolicy::FailClosed;

    ModelPrice default_price{};

    TokenConfig tokens;
    LedgerConfig ledger;
    BreakerConfig breaker;
    RateLimitConfig rate_limit;
    RetryPolicy retry;
    AuditConfig audit;
};

// Overlays AGENTGATE_* environment variables onto `base`.
// Durations are given in milliseconds. Throws InvalidConfigException on
// unparsable values.
Config load_config_from_env(Config base = Config{});

// Throws InvalidConfigException if settings are inconsistent
void validate_config(const Config& config);

inline const char* to_string(VaultFailurePolicy p) {
    switch (p) {
        case VaultFailurePolicy::FailClosed:       return "FailClosed";
        case VaultFailurePolicy::TryNextCandidate: return "TryNextCandidate";
    }
    return "Unknown";
}

} // namespace agentgate
