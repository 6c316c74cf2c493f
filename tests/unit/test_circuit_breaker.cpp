#include <gtest/gtest.h>
#include <agentgate/agentgate.hpp>

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace agentgate;
using namespace std::chrono_literals;

class TestMonitor : public Monitor {
public:
    void on_event(const MonitorEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }
    std::size_t count_of(EventType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (auto& e : events_) {
            if (e.type == type) ++n;
        }
        return n;
    }

private:
    std::mutex mutex_;
    std::vector<MonitorEvent> events_;
};

namespace {

BreakerConfig fast_config(std::uint32_t threshold = 3) {
    BreakerConfig cfg;
    cfg.failure_threshold = threshold;
    cfg.failure_window = 10s;
    cfg.cooldown = 30ms;
    return cfg;
}

void fail_n(CircuitBreaker& breaker, int n) {
    for (int i = 0; i < n; ++i) breaker.record_failure();
}

} // anonymous namespace

// ===========================================================================
// State machine
// ===========================================================================

TEST(CircuitBreakerTest, StartsClosedAndAllows) {
    CircuitBreaker breaker("openai", fast_config());
    EXPECT_EQ(breaker.state(), BreakerState::Closed);
    auto permit = breaker.allow_request();
    EXPECT_TRUE(permit.allowed);
    EXPECT_FALSE(permit.is_probe);
}

TEST(CircuitBreakerTest, OpensAtThreshold) {
    auto monitor = std::make_shared<TestMonitor>();
    CircuitBreaker breaker("openai", fast_config(3), monitor);

    fail_n(breaker, 2);
    EXPECT_EQ(breaker.state(), BreakerState::Closed);
    EXPECT_EQ(breaker.failure_count(), 2u);

    breaker.record_failure();
    EXPECT_EQ(breaker.state(), BreakerState::Open);
    EXPECT_FALSE(breaker.allow_request().allowed);
    EXPECT_EQ(monitor->count_of(EventType::BreakerOpened), 1u);
}

TEST(CircuitBreakerTest, FailuresOutsideWindowDoNotAccumulate) {
    BreakerConfig cfg = fast_config(3);
    cfg.failure_window = 20ms;
    CircuitBreaker breaker("openai", cfg);

    fail_n(breaker, 2);
    std::this_thread::sleep_for(40ms);
    breaker.record_failure();
    EXPECT_EQ(breaker.state(), BreakerState::Closed);
    EXPECT_EQ(breaker.failure_count(), 1u);
}

TEST(CircuitBreakerTest, SuccessWhileClosedKeepsFailureCount) {
    CircuitBreaker breaker("openai", fast_config(3));
    fail_n(breaker, 2);
    breaker.record_success();
    breaker.record_failure();
    EXPECT_EQ(breaker.state(), BreakerState::Open);
}

TEST(CircuitBreakerTest, CooldownAdmitsExactlyOneProbe) {
    auto monitor = std::make_shared<TestMonitor>();
    CircuitBreaker breaker("openai", fast_config(1), monitor);
    breaker.record_failure();
    ASSERT_FALSE(breaker.allow_request().allowed);

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(breaker.state(), BreakerState::HalfOpen);

    auto probe = breaker.allow_request();
    EXPECT_TRUE(probe.allowed);
    EXPECT_TRUE(probe.is_probe);
    EXPECT_FALSE(breaker.allow_request().allowed);
    EXPECT_EQ(monitor->count_of(EventType::BreakerHalfOpened), 1u);
}

TEST(CircuitBreakerTest, ProbeSuccessCloses) {
    auto monitor = std::make_shared<TestMonitor>();
    CircuitBreaker breaker("openai", fast_config(1), monitor);
    breaker.record_failure();
    std::this_thread::sleep_for(50ms);
    ASSERT_TRUE(breaker.allow_request().is_probe);

    breaker.record_success();
    EXPECT_EQ(breaker.state(), BreakerState::Closed);
    EXPECT_EQ(breaker.failure_count(), 0u);
    EXPECT_TRUE(breaker.allow_request().allowed);
    EXPECT_EQ(monitor->count_of(EventType::BreakerClosed), 1u);
}

TEST(CircuitBreakerTest, ProbeFailureReopensWithFreshCooldown) {
    CircuitBreaker breaker("openai", fast_config(1));
    breaker.record_failure();
    std::this_thread::sleep_for(50ms);
    ASSERT_TRUE(breaker.allow_request().is_probe);

    breaker.record_failure();
    EXPECT_EQ(breaker.state(), BreakerState::Open);
    EXPECT_FALSE(breaker.allow_request().allowed);

    std::this_thread::sleep_for(50ms);
    EXPECT_TRUE(breaker.allow_request().is_probe);
}

TEST(CircuitBreakerTest, CancelledProbeHandsPermitToNextCaller) {
    CircuitBreaker breaker("openai", fast_config(1));
    breaker.record_failure();
    std::this_thread::sleep_for(50ms);
    ASSERT_TRUE(breaker.allow_request().is_probe);

    breaker.cancel_probe();
    auto next = breaker.allow_request();
    EXPECT_TRUE(next.allowed);
    EXPECT_TRUE(next.is_probe);
}

TEST(CircuitBreakerTest, StaleProbeReclaimedAfterCooldown) {
    CircuitBreaker breaker("openai", fast_config(1));
    breaker.record_failure();
    std::this_thread::sleep_for(50ms);
    ASSERT_TRUE(breaker.allow_request().is_probe);
    // Probe holder never reports back
    EXPECT_FALSE(breaker.allow_request().allowed);

    std::this_thread::sleep_for(50ms);
    EXPECT_TRUE(breaker.allow_request().is_probe);
}

TEST(CircuitBreakerTest, ResetForcesClosed) {
    CircuitBreaker breaker("openai", fast_config(1));
    breaker.record_failure();
    ASSERT_EQ(breaker.state(), BreakerState::Open);

    breaker.reset();
    EXPECT_EQ(breaker.state(), BreakerState::Closed);
    EXPECT_EQ(breaker.failure_count(), 0u);
}

TEST(CircuitBreakerTest, ConcurrentCallersGetSingleProbe) {
    CircuitBreaker breaker("openai", fast_config(1));
    breaker.record_failure();
    std::this_thread::sleep_for(50ms);

    std::atomic<int> probes{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&] {
            auto permit = breaker.allow_request();
            if (permit.allowed && permit.is_probe) probes++;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(probes.load(), 1);
}

// ===========================================================================
// Registry
// ===========================================================================

TEST(CircuitBreakerRegistryTest, OneBreakerPerDependency) {
    CircuitBreakerRegistry registry(fast_config());
    auto a = registry.get_or_create("openai");
    auto b = registry.get_or_create("openai");
    auto c = registry.get_or_create("anthropic");
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(CircuitBreakerRegistryTest, UnknownDependencyIsClosed) {
    CircuitBreakerRegistry registry;
    EXPECT_EQ(registry.state("never-seen"), BreakerState::Closed);
    EXPECT_EQ(registry.find("never-seen"), nullptr);
}

TEST(CircuitBreakerRegistryTest, OverrideAppliesToNewBreaker) {
    CircuitBreakerRegistry registry(fast_config(5));
    registry.get_or_create("openai")->record_failure();

    registry.set_override("openai", fast_config(1));
    auto breaker = registry.get_or_create("openai");
    EXPECT_EQ(breaker->config().failure_threshold, 1u);
    EXPECT_EQ(breaker->failure_count(), 0u);

    breaker->record_failure();
    EXPECT_EQ(registry.state("openai"), BreakerState::Open);
}

TEST(CircuitBreakerRegistryTest, StatesSortedByName) {
    CircuitBreakerRegistry registry(fast_config(1));
    registry.get_or_create("openai");
    registry.get_or_create("anthropic")->record_failure();

    auto states = registry.states();
    ASSERT_EQ(states.size(), 2u);
    EXPECT_EQ(states[0].first, "anthropic");
    EXPECT_EQ(states[0].second, BreakerState::Open);
    EXPECT_EQ(states[1].first, "openai");
    EXPECT_EQ(states[1].second, BreakerState::Closed);
}

TEST(CircuitBreakerRegistryTest, MonitorAttachedToNewBreakers) {
    auto monitor = std::make_shared<TestMonitor>();
    CircuitBreakerRegistry registry(fast_config(1));
    registry.set_monitor(monitor);

    registry.get_or_create("openai")->record_failure();
    EXPECT_EQ(monitor->count_of(EventType::BreakerOpened), 1u);
}

TEST(CircuitBreakerRegistryTest, MonitorReachesExistingBreakers) {
    CircuitBreakerRegistry registry(fast_config(1));
    auto breaker = registry.get_or_create("openai");

    auto monitor = std::make_shared<TestMonitor>();
    registry.set_monitor(monitor);

    breaker->record_failure();
    EXPECT_EQ(monitor->count_of(EventType::BreakerOpened), 1u);
}
