#include "agentgate/rate_limiter.hpp"

#include <algorithm>
#include <cmath>

namespace agentgate {

RateLimiter::RateLimiter(RateLimitConfig config)
    : config_(std::move(config)) {}

RateDecision RateLimiter::check(const std::string& key, const RateLimitRule& fallback) {
    return check_keys({{key, fallback}});
}

RateDecision RateLimiter::check_agent(const AgentId& agent_id) {
    return check(agent_key(agent_id), config_.per_agent);
}

RateDecision RateLimiter::check_endpoint(const std::string& endpoint) {
    return check(endpoint_key(endpoint), config_.per_endpoint);
}

RateDecision RateLimiter::check_request(const AgentId& agent_id, const std::string& endpoint) {
    return check_keys({{agent_key(agent_id), config_.per_agent},
                       {endpoint_key(endpoint), config_.per_endpoint}});
}

RateDecision RateLimiter::check_keys(const std::vector<std::pair<std::string, RateLimitRule>>& keys) {
    if (!config_.enabled) {
        return RateDecision{};
    }

    auto now = Clock::now();
    RateDecision decision;
    std::string limited_key;
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = monitor_;

        // Every key must admit before any of them is charged
        std::vector<WindowState*> admitted;
        admitted.reserve(keys.size());
        for (auto& [key, fallback] : keys) {
            auto rule_it = overrides_.find(key);
            const RateLimitRule rule = rule_it != overrides_.end() ? rule_it->second : fallback;
            if (rule.window <= Duration::zero()) {
                continue;
            }

            Duration wait{};
            auto* state = evaluate(key, rule, now, wait);
            if (!state) {
                decision.allowed = false;
                decision.retry_after = std::max(decision.retry_after, wait);
                if (limited_key.empty()) limited_key = key;
                continue;
            }
            admitted.push_back(state);
        }

        if (decision.allowed) {
            for (auto* state : admitted) {
                ++state->current;
            }
            return decision;
        }
    }

    auto event = make_event(EventType::RateLimited, "Rate limit exceeded for " + limited_key);
    event.duration_us = std::chrono::duration<double, std::micro>(decision.retry_after).count();
    emit(monitor, std::move(event));
    return decision;
}

// Requires mutex_ held. Rolls the key's windows forward and returns its state
// if one more request fits, or nullptr with `wait` set to the retry delay.
RateLimiter::WindowState* RateLimiter::evaluate(const std::string& key, const RateLimitRule& rule,
                                                Timestamp now, Duration& wait) {
    if (windows_.size() >= config_.max_tracked_keys && windows_.count(key) == 0) {
        prune_idle(now);
    }

    const auto since_epoch = now.time_since_epoch();
    const std::int64_t index = since_epoch / rule.window;
    const Duration elapsed = since_epoch - rule.window * index;

    auto& state = windows_[key];
    if (state.window != rule.window) {
        state = WindowState{};
        state.window = rule.window;
        state.window_index = index;
    }
    // Anything older than one window has decayed fully
    if (index == state.window_index + 1) {
        state.previous = state.current;
        state.current = 0;
    } else if (index > state.window_index + 1) {
        state.previous = 0;
        state.current = 0;
    }
    state.window_index = index;
    state.last_seen = now;

    const double window_ns = static_cast<double>(rule.window.count());
    const double fraction = static_cast<double>(elapsed.count()) / window_ns;
    const double estimate = state.previous * (1.0 - fraction) + state.current;

    if (estimate < static_cast<double>(rule.limit)) {
        return &state;
    }

    // Time until the weighted previous count decays enough, assuming no
    // further admissions
    double wait_ns = 0.0;
    if (state.current < rule.limit && state.previous > 0) {
        double target = 1.0 - static_cast<double>(rule.limit - state.current) / state.previous;
        wait_ns = (target - fraction) * window_ns;
    } else {
        double rolled = state.current > 0
            ? 1.0 - static_cast<double>(rule.limit) / state.current
            : 0.0;
        wait_ns = (1.0 - fraction) * window_ns + std::max(rolled, 0.0) * window_ns;
    }
    wait = std::chrono::duration_cast<Duration>(
        std::chrono::nanoseconds(static_cast<std::int64_t>(std::ceil(std::max(wait_ns, 1.0)))));
    return nullptr;
}

void RateLimiter::set_rule(const std::string& key, RateLimitRule rule) {
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_[key] = rule;
}

std::size_t RateLimiter::tracked_keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_.size();
}

void RateLimiter::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

// Requires mutex_ held
void RateLimiter::prune_idle(Timestamp now) {
    for (auto it = windows_.begin(); it != windows_.end();) {
        // Idle for two windows: both counters would read zero
        if (now - it->second.last_seen >= 2 * it->second.window) {
            it = windows_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace agentgate
