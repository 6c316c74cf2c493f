#include "agentgate/circuit_breaker.hpp"

#include <algorithm>
#include <mutex>

namespace agentgate {

namespace {

constexpr int STATE_SHIFT = 62;
constexpr std::uint64_t TIME_MASK = (std::uint64_t{1} << STATE_SHIFT) - 1;

std::int64_t now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        Clock::now().time_since_epoch()).count();
}

std::int64_t to_ns(Duration d) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(d).count();
}

std::uint64_t pack(BreakerState state, std::int64_t ns) {
    auto t = static_cast<std::uint64_t>(std::max<std::int64_t>(ns, 0)) & TIME_MASK;
    return (static_cast<std::uint64_t>(state) << STATE_SHIFT) | t;
}

BreakerState state_of(std::uint64_t word) {
    return static_cast<BreakerState>(word >> STATE_SHIFT);
}

std::int64_t time_of(std::uint64_t word) {
    return static_cast<std::int64_t>(word & TIME_MASK);
}

} // anonymous namespace

// ========== CircuitBreaker ==========

CircuitBreaker::CircuitBreaker(std::string dependency, BreakerConfig config,
                               std::shared_ptr<Monitor> monitor)
    : dependency_(std::move(dependency))
    , config_(config)
    , monitor_(std::move(monitor))
    , word_(pack(BreakerState::Closed, now_ns()))
    , window_start_ns_(now_ns())
{}

BreakerPermit CircuitBreaker::allow_request() {
    auto word = word_.load(std::memory_order_acquire);
    auto now = now_ns();
    auto cooldown = to_ns(config_.cooldown);

    switch (state_of(word)) {
        case BreakerState::Closed:
            return BreakerPermit{true, false};

        case BreakerState::Open:
            if (now - time_of(word) < cooldown) {
                return BreakerPermit{false, false};
            }
            if (word_.compare_exchange_strong(word, pack(BreakerState::HalfOpen, now),
                                              std::memory_order_acq_rel)) {
                emit_transition(EventType::BreakerHalfOpened, BreakerState::HalfOpen,
                                "Cooldown elapsed; admitting one probe");
                return BreakerPermit{true, true};
            }
            return BreakerPermit{false, false};

        case BreakerState::HalfOpen:
            // A probe that never reported back is reclaimable after another cooldown
            if (now - time_of(word) >= cooldown &&
                word_.compare_exchange_strong(word, pack(BreakerState::HalfOpen, now),
                                              std::memory_order_acq_rel)) {
                return BreakerPermit{true, true};
            }
            return BreakerPermit{false, false};
    }
    return BreakerPermit{false, false};
}

void CircuitBreaker::record_success() {
    auto word = word_.load(std::memory_order_acquire);
    if (state_of(word) != BreakerState::HalfOpen) {
        return;
    }

    auto now = now_ns();
    if (word_.compare_exchange_strong(word, pack(BreakerState::Closed, now),
                                      std::memory_order_acq_rel)) {
        failures_.store(0);
        window_start_ns_.store(now);
        emit_transition(EventType::BreakerClosed, BreakerState::Closed, "Probe succeeded");
    }
}

void CircuitBreaker::record_failure() {
    auto word = word_.load(std::memory_order_acquire);
    auto now = now_ns();

    switch (state_of(word)) {
        case BreakerState::Closed: {
            auto window_start = window_start_ns_.load();
            if (now - window_start > to_ns(config_.failure_window) &&
                window_start_ns_.compare_exchange_strong(window_start, now)) {
                failures_.store(0);
            }

            auto count = failures_.fetch_add(1) + 1;
            if (count >= config_.failure_threshold &&
                word_.compare_exchange_strong(word, pack(BreakerState::Open, now),
                                              std::memory_order_acq_rel)) {
                emit_transition(EventType::BreakerOpened, BreakerState::Open,
                                std::to_string(count) + " failures within window");
            }
            break;
        }

        case BreakerState::HalfOpen:
            if (word_.compare_exchange_strong(word, pack(BreakerState::Open, now),
                                              std::memory_order_acq_rel)) {
                emit_transition(EventType::BreakerOpened, BreakerState::Open,
                                "Probe failed; cooldown restarted");
            }
            break;

        case BreakerState::Open:
            // Late report from a call admitted before the breaker opened
            break;
    }
}

void CircuitBreaker::cancel_probe() {
    auto word = word_.load(std::memory_order_acquire);
    if (state_of(word) != BreakerState::HalfOpen) {
        return;
    }
    // Back to Open with the cooldown already elapsed, so the next caller probes
    word_.compare_exchange_strong(word,
                                  pack(BreakerState::Open, now_ns() - to_ns(config_.cooldown)),
                                  std::memory_order_acq_rel);
}

BreakerState CircuitBreaker::state() const {
    auto word = word_.load(std::memory_order_acquire);
    auto state = state_of(word);
    if (state == BreakerState::Open && now_ns() - time_of(word) >= to_ns(config_.cooldown)) {
        return BreakerState::HalfOpen;
    }
    return state;
}

void CircuitBreaker::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::atomic_store(&monitor_, std::move(monitor));
}

std::uint32_t CircuitBreaker::failure_count() const noexcept {
    return failures_.load();
}

void CircuitBreaker::reset() {
    auto now = now_ns();
    auto previous = word_.exchange(pack(BreakerState::Closed, now), std::memory_order_acq_rel);
    failures_.store(0);
    window_start_ns_.store(now);
    if (state_of(previous) != BreakerState::Closed) {
        emit_transition(EventType::BreakerClosed, BreakerState::Closed, "Reset");
    }
}

void CircuitBreaker::emit_transition(EventType type, BreakerState state,
                                     const std::string& message) {
    auto event = make_event(type, message);
    event.provider_id = dependency_;
    event.breaker_state = state;
    emit(std::atomic_load(&monitor_), std::move(event));
}

// ========== CircuitBreakerRegistry ==========

CircuitBreakerRegistry::CircuitBreakerRegistry(BreakerConfig defaults)
    : defaults_(defaults) {}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get_or_create(const std::string& dependency) {
    {
        std::shared_lock lock(mutex_);
        auto it = breakers_.find(dependency);
        if (it != breakers_.end()) return it->second;
    }

    std::unique_lock lock(mutex_);
    auto it = breakers_.find(dependency);
    if (it != breakers_.end()) return it->second;

    auto override_it = overrides_.find(dependency);
    auto config = override_it != overrides_.end() ? override_it->second : defaults_;
    auto breaker = std::make_shared<CircuitBreaker>(dependency, config, monitor_);
    breakers_.emplace(dependency, breaker);
    return breaker;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::find(const std::string& dependency) const {
    std::shared_lock lock(mutex_);
    auto it = breakers_.find(dependency);
    if (it == breakers_.end()) return nullptr;
    return it->second;
}

void CircuitBreakerRegistry::set_override(const std::string& dependency, BreakerConfig config) {
    std::unique_lock lock(mutex_);
    overrides_[dependency] = config;
    breakers_.erase(dependency);
}

BreakerState CircuitBreakerRegistry::state(const std::string& dependency) const {
    auto breaker = find(dependency);
    return breaker ? breaker->state() : BreakerState::Closed;
}

std::vector<std::pair<std::string, BreakerState>> CircuitBreakerRegistry::states() const {
    std::shared_lock lock(mutex_);
    std::vector<std::pair<std::string, BreakerState>> result;
    result.reserve(breakers_.size());
    for (auto& [name, breaker] : breakers_) {
        result.emplace_back(name, breaker->state());
    }
    std::sort(result.begin(), result.end());
    return result;
}

void CircuitBreakerRegistry::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::unique_lock lock(mutex_);
    monitor_ = monitor;
    for (auto& [_, breaker] : breakers_) {
        breaker->set_monitor(monitor);
    }
}

} // namespace agentgate
