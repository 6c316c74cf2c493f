#pragma once

#include "agentgate/types.hpp"
#include "agentgate/config.hpp"
#include "agentgate/monitor.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace agentgate {

// Outcome of asking a breaker whether a call may proceed
struct BreakerPermit {
    bool allowed{false};
    // The single Half-Open trial call; its outcome decides the next state
    bool is_probe{false};
};

// Three-state circuit breaker for one dependency.
//
// State and the time of the last transition share one atomic word
// (state in the top 2 bits, steady-clock nanoseconds in the low 62), so
// reads are lock-free and every transition is a single compare-and-swap.
class CircuitBreaker {
public:
    CircuitBreaker(std::string dependency, BreakerConfig config,
                   std::shared_ptr<Monitor> monitor = nullptr);

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    // Closed: always allowed. Open past cooldown: exactly one caller wins the
    // probe. Half-Open: refused unless the outstanding probe is stale.
    BreakerPermit allow_request();

    void record_success();
    void record_failure();

    // Hands back a probe permit that was never used for a call
    void cancel_probe();

    // An Open breaker whose cooldown has elapsed reports HalfOpen
    BreakerState state() const;

    std::uint32_t failure_count() const noexcept;
    const std::string& dependency() const noexcept { return dependency_; }
    const BreakerConfig& config() const noexcept { return config_; }

    // Administrative: force back to Closed with counters cleared
    void reset();

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    std::string dependency_;
    BreakerConfig config_;
    std::shared_ptr<Monitor> monitor_;

    std::atomic<std::uint64_t> word_;
    std::atomic<std::uint32_t> failures_{0};
    std::atomic<std::int64_t> window_start_ns_{0};

    void emit_transition(EventType type, BreakerState state, const std::string& message);
};

// Process-wide set of breakers, one per dependency, created on first use
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(BreakerConfig defaults = BreakerConfig{});

    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    std::shared_ptr<CircuitBreaker> get_or_create(const std::string& dependency);
    std::shared_ptr<CircuitBreaker> find(const std::string& dependency) const;

    // Replaces any existing breaker for the dependency with a fresh one
    void set_override(const std::string& dependency, BreakerConfig config);

    // Unknown dependencies are Closed
    BreakerState state(const std::string& dependency) const;
    std::vector<std::pair<std::string, BreakerState>> states() const;

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    BreakerConfig defaults_;
    std::shared_ptr<Monitor> monitor_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, BreakerConfig> overrides_;
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

} // namespace agentgate
