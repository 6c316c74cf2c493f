#pragma once

#include "agentgate/types.hpp"
#include "agentgate/config.hpp"
#include "agentgate/monitor.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace agentgate {

struct RateDecision {
    bool allowed{true};
    // Earliest point at which a retry could be admitted; zero when allowed
    Duration retry_after{Duration::zero()};
};

// Sliding-window counter limiter.
//
// Each key keeps counts for the current and previous fixed window; the
// estimate is previous * (1 - elapsed_fraction) + current. A request is
// admitted while the estimate is below the limit, which bounds any window
// of the configured length to at most twice the limit.
class RateLimiter {
public:
    explicit RateLimiter(RateLimitConfig config = RateLimitConfig{});

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Uses the rule registered for the key, or `fallback` if there is none
    RateDecision check(const std::string& key, const RateLimitRule& fallback);

    RateDecision check_agent(const AgentId& agent_id);
    RateDecision check_endpoint(const std::string& endpoint);

    // Agent and endpoint-class limits together: both are charged only if
    // both admit
    RateDecision check_request(const AgentId& agent_id, const std::string& endpoint);

    // Per-key override of the class rule
    void set_rule(const std::string& key, RateLimitRule rule);

    std::size_t tracked_keys() const;
    void set_monitor(std::shared_ptr<Monitor> monitor);

    static std::string agent_key(const AgentId& agent_id) { return "agent:" + agent_id; }
    static std::string endpoint_key(const std::string& endpoint) { return "endpoint:" + endpoint; }

private:
    struct WindowState {
        std::int64_t window_index{0};
        std::uint32_t current{0};
        std::uint32_t previous{0};
        Timestamp last_seen{};
        Duration window{};
    };

    RateLimitConfig config_;
    std::shared_ptr<Monitor> monitor_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, WindowState> windows_;
    std::unordered_map<std::string, RateLimitRule> overrides_;

    RateDecision check_keys(const std::vector<std::pair<std::string, RateLimitRule>>& keys);
    WindowState* evaluate(const std::string& key, const RateLimitRule& rule,
                          Timestamp now, Duration& wait);
    void prune_idle(Timestamp now);
};

} // namespace agentgate
