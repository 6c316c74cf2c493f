#include <gtest/gtest.h>
#include <agentgate/agentgate.hpp>

#include <atomic>
#include <deque>
#include <mutex>
#include <thread>

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

// Answers with a fixed status, or from a script when one is queued
class FakeTransport : public HttpTransport {
public:
    FakeTransport(int status, std::string body)
        : status_(status), body_(std::move(body)) {}

    HttpResponse send(const HttpRequest& request) override {
        calls++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_request_ = request;
        }
        if (delay > Duration::zero()) {
            // Gives up at the request timeout like a socket read would
            if (request.timeout > Duration::zero() && request.timeout < delay) {
                std::this_thread::sleep_for(request.timeout);
                return HttpResponse{0, "", true};
            }
            std::this_thread::sleep_for(delay);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (!script_.empty()) {
            auto next = script_.front();
            script_.pop_front();
            return next;
        }
        return HttpResponse{status_, body_, false};
    }

    void set_status(int status) {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = status;
    }
    void queue(int status, std::string body = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(HttpResponse{status, std::move(body), false});
    }
    HttpRequest last_request() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_request_;
    }

    std::atomic<int> calls{0};
    Duration delay{Duration::zero()};

private:
    std::mutex mutex_;
    int status_;
    std::string body_;
    std::deque<HttpResponse> script_;
    HttpRequest last_request_;
};

class SwitchableStore : public InMemoryCredentialStore {
public:
    std::atomic<bool> down{false};

    std::optional<crypto::EncryptedSecret> get(const ProviderId& provider_id) override {
        if (down) throw VaultUnavailableException("vault unreachable");
        return InMemoryCredentialStore::get(provider_id);
    }
};

class RecordingSink : public AuditSink {
public:
    void publish(const AuditEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events.push_back(event);
    }
    std::vector<AuditEvent> events;

private:
    std::mutex mutex_;
};

namespace {

// 1000 output tokens at this price cost exactly $4
const ModelPrice FOUR_DOLLAR_PRICE{0, 4'000'000'000, 1000};

const char* OPENAI_BODY =
    R"({"choices":[{"message":{"content":"ok"}}],"usage":{"prompt_tokens":0,"completion_tokens":1000}})";
const char* ANTHROPIC_BODY =
    R"({"content":[{"text":"ok"}],"usage":{"input_tokens":0,"output_tokens":1000}})";

} // anonymous namespace

// ===========================================================================
// Fixture: "chat" served by openai (preferred) then anthropic
// ===========================================================================

class GatewayTest : public ::testing::Test {
protected:
    Config config;
    std::shared_ptr<TestMonitor> monitor = std::make_shared<TestMonitor>();
    std::shared_ptr<FakeTransport> openai = std::make_shared<FakeTransport>(200, OPENAI_BODY);
    std::shared_ptr<FakeTransport> anthropic = std::make_shared<FakeTransport>(200, ANTHROPIC_BODY);
    std::shared_ptr<SwitchableStore> store = std::make_shared<SwitchableStore>();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();

    std::vector<Duration> sleeps;
    std::mutex sleeps_mutex;
    GatewayComponents components;
    std::unique_ptr<Gateway> gateway;
    std::string token;

    void SetUp() override {
        config.tokens.signing_secret = "integration-secret";
        config.retry.max_attempts = 1;
        config.breaker.failure_threshold = 5;
        config.breaker.cooldown = std::chrono::minutes(5);
        config.ledger.enable_expiry_sweep = false;
        config.worker_threads = 4;
    }

    void build() {
        auto vault = std::make_shared<CredentialVault>(
            crypto::SecretCipher(crypto::random_bytes(crypto::KEY_SIZE)), store);
        vault->register_credential("openai", "sk-proj-integration");
        vault->register_credential("anthropic", "sk-ant-integration");

        components.validator = std::make_shared<TokenValidator>(config.tokens);
        components.translator = std::make_shared<TokenTranslator>(vault);
        components.translator->bind("agent-1", "openai");
        components.translator->bind("agent-1", "anthropic");

        components.ledger = std::make_shared<BudgetLedger>(config.ledger);
        components.ledger->open_account("agent-1", usd_to_micros(10.0));

        components.pricing = std::make_shared<PricingTable>();
        components.pricing->set_price("gpt-4o", FOUR_DOLLAR_PRICE);
        components.pricing->set_price("claude-sonnet", FOUR_DOLLAR_PRICE);

        components.breakers = std::make_shared<CircuitBreakerRegistry>(config.breaker);
        components.selector = std::make_shared<FallbackChainSelector>(components.breakers);
        components.selector->add_tier("chat", FallbackTier{"openai", "gpt-4o", 2.0, 0.9});
        components.selector->add_tier("chat", FallbackTier{"anthropic", "claude-sonnet", 1.0, 0.9});

        components.rate_limiter = std::make_shared<RateLimiter>(config.rate_limit);

        components.providers = std::make_shared<ProviderRegistry>();
        components.providers->register_adapter(std::make_shared<OpenAiAdapter>("openai", openai));
        components.providers->register_adapter(std::make_shared<AnthropicAdapter>("anthropic", anthropic));

        components.audit = std::make_shared<AuditDispatcher>(sink, config.audit);

        gateway = std::make_unique<Gateway>(config, components);
        gateway->set_monitor(monitor);
        gateway->set_sleeper([this](Duration d) {
            std::lock_guard<std::mutex> lock(sleeps_mutex);
            sleeps.push_back(d);
        });

        token = components.validator->mint("agent-1", "Agent One", {"llm:call"});
    }

    InferenceRequest chat() {
        InferenceRequest request;
        request.bearer_token = token;
        request.capability = "chat";
        request.payload = "hello";
        return request;
    }

    Money remaining() {
        return components.ledger->remaining("agent-1").value_or(-1);
    }
};

TEST_F(GatewayTest, ServesFromPreferredProviderAndCharges) {
    build();
    auto response = gateway->handle(chat());

    ASSERT_EQ(response.status, ResponseStatus::Ok);
    EXPECT_EQ(response.provider_id, "openai");
    EXPECT_EQ(response.model, "gpt-4o");
    EXPECT_EQ(response.actual_cost, usd_to_micros(4.0));
    EXPECT_EQ(response.remaining_budget, usd_to_micros(6.0));
    EXPECT_EQ(response.attempts, 1u);
    EXPECT_EQ(remaining(), usd_to_micros(6.0));
    EXPECT_EQ(anthropic->calls.load(), 0);

    // The agent never sees the provider key; the gateway attaches it
    bool has_key = false;
    for (auto& [name, value] : openai->last_request().headers) {
        if (name == "Authorization" && value == "Bearer sk-proj-integration") has_key = true;
    }
    EXPECT_TRUE(has_key);
    EXPECT_EQ(monitor->count_of(EventType::RequestSucceeded), 1u);
}

TEST_F(GatewayTest, ConcurrentRequestsNeverOverspend) {
    openai->delay = 50ms;
    build();

    std::vector<std::future<InferenceResponse>> futures;
    for (int i = 0; i < 3; ++i) {
        futures.push_back(gateway->submit(chat()));
    }

    int ok = 0;
    int exceeded = 0;
    for (auto& f : futures) {
        auto r = f.get();
        if (r.status == ResponseStatus::Ok) ++ok;
        if (r.status == ResponseStatus::BudgetExceeded) ++exceeded;
    }
    EXPECT_EQ(ok, 2);
    EXPECT_EQ(exceeded, 1);
    EXPECT_EQ(remaining(), usd_to_micros(2.0));
    EXPECT_EQ(openai->calls.load(), 2);
}

TEST_F(GatewayTest, StressAdmissionStaysWithinLimit) {
    openai->delay = 1ms;
    build();
    components.ledger->set_limit("agent-1", usd_to_micros(100.0));

    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 5; ++i) {
                if (gateway->handle(chat()).ok()) ok++;
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(ok.load(), 25);
    EXPECT_EQ(remaining(), 0);
    auto snapshot = components.ledger->snapshot("agent-1");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->pending, 0);
}

TEST_F(GatewayTest, FailingProviderIsShortCircuitedAfterThreshold) {
    openai->set_status(503);
    build();
    components.ledger->set_limit("agent-1", usd_to_micros(100.0));

    for (int i = 0; i < 5; ++i) {
        auto r = gateway->handle(chat());
        ASSERT_EQ(r.status, ResponseStatus::Ok);
        EXPECT_EQ(r.provider_id, "anthropic");
    }
    EXPECT_EQ(openai->calls.load(), 5);
    EXPECT_EQ(components.breakers->state("openai"), BreakerState::Open);

    auto r = gateway->handle(chat());
    EXPECT_EQ(r.status, ResponseStatus::Ok);
    EXPECT_EQ(r.provider_id, "anthropic");
    EXPECT_EQ(openai->calls.load(), 5);
    EXPECT_EQ(monitor->count_of(EventType::BreakerOpened), 1u);
}

TEST_F(GatewayTest, AllBreakersOpenMeansNoUpstreamCalls) {
    build();
    for (auto provider : {"openai", "anthropic"}) {
        auto breaker = components.breakers->get_or_create(provider);
        for (int i = 0; i < 5; ++i) breaker->record_failure();
    }

    auto r = gateway->handle(chat());
    EXPECT_EQ(r.status, ResponseStatus::AllProvidersUnavailable);
    EXPECT_EQ(openai->calls.load(), 0);
    EXPECT_EQ(anthropic->calls.load(), 0);
    EXPECT_EQ(remaining(), usd_to_micros(10.0));
}

TEST_F(GatewayTest, RetriesWithBackoffBeforeAdvancing) {
    config.retry.max_attempts = 3;
    build();
    openai->queue(500);
    openai->queue(429);

    auto r = gateway->handle(chat());
    ASSERT_EQ(r.status, ResponseStatus::Ok);
    EXPECT_EQ(r.provider_id, "openai");
    EXPECT_EQ(r.attempts, 3u);
    ASSERT_EQ(sleeps.size(), 2u);
    EXPECT_LE(sleeps[0], config.retry.nominal_delay(1));
    EXPECT_LE(sleeps[1], config.retry.nominal_delay(2));
    EXPECT_EQ(monitor->count_of(EventType::ProviderAttemptFailed), 2u);
}

TEST_F(GatewayTest, RejectedCredentialAdvancesWithoutRetry) {
    config.retry.max_attempts = 3;
    openai->set_status(401);
    build();

    auto r = gateway->handle(chat());
    EXPECT_EQ(r.status, ResponseStatus::Ok);
    EXPECT_EQ(r.provider_id, "anthropic");
    EXPECT_EQ(openai->calls.load(), 1);
    EXPECT_EQ(components.breakers->find("openai")->failure_count(), 1u);
}

TEST_F(GatewayTest, BadRequestIsTerminalAndReleasesHold) {
    openai->set_status(400);
    build();

    auto r = gateway->handle(chat());
    EXPECT_EQ(r.status, ResponseStatus::InvalidRequest);
    EXPECT_EQ(anthropic->calls.load(), 0);
    EXPECT_EQ(remaining(), usd_to_micros(10.0));
    EXPECT_EQ(r.remaining_budget, usd_to_micros(10.0));
    EXPECT_EQ(components.breakers->find("openai")->failure_count(), 0u);
}

TEST_F(GatewayTest, AllProvidersFailingReleasesHold) {
    openai->set_status(503);
    anthropic->set_status(502);
    build();

    auto r = gateway->handle(chat());
    EXPECT_EQ(r.status, ResponseStatus::AllProvidersUnavailable);
    EXPECT_EQ(remaining(), usd_to_micros(10.0));
    EXPECT_EQ(monitor->count_of(EventType::ReservationReleased), 1u);
}

// ===========================================================================
// Rejections before any provider is touched
// ===========================================================================

TEST_F(GatewayTest, GarbageTokenIsUnauthenticated) {
    build();
    auto request = chat();
    request.bearer_token = "agk_not.a-token";
    EXPECT_EQ(gateway->handle(request).status, ResponseStatus::Unauthenticated);
    request.bearer_token.clear();
    EXPECT_EQ(gateway->handle(request).status, ResponseStatus::Unauthenticated);
    EXPECT_EQ(openai->calls.load(), 0);
}

TEST_F(GatewayTest, RevokedTokenIsRejected) {
    build();
    ASSERT_TRUE(gateway->handle(chat()).ok());

    components.validator->revoke(token);
    auto r = gateway->handle(chat());
    EXPECT_EQ(r.status, ResponseStatus::Revoked);
    EXPECT_EQ(openai->calls.load(), 1);
}

TEST_F(GatewayTest, RotationInvalidatesOldToken) {
    build();
    auto old_token = token;
    token = components.validator->rotate("agent-1");

    EXPECT_TRUE(gateway->handle(chat()).ok());
    auto request = chat();
    request.bearer_token = old_token;
    EXPECT_EQ(gateway->handle(request).status, ResponseStatus::Revoked);
}

TEST_F(GatewayTest, MissingScopeIsForbidden) {
    build();
    components.translator->bind("agent-2", "openai");
    components.ledger->open_account("agent-2", usd_to_micros(10.0));
    auto request = chat();
    request.bearer_token = components.validator->mint("agent-2", "Reader", {"llm:read"});

    EXPECT_EQ(gateway->handle(request).status, ResponseStatus::Forbidden);
    EXPECT_EQ(openai->calls.load(), 0);
}

TEST_F(GatewayTest, AgentWithoutAccountIsForbidden) {
    build();
    components.translator->bind("agent-3", "openai");
    auto request = chat();
    request.bearer_token = components.validator->mint("agent-3", "No Budget", {"llm:call"});

    EXPECT_EQ(gateway->handle(request).status, ResponseStatus::Forbidden);
}

TEST_F(GatewayTest, RateLimitedCarriesRetryAfter) {
    config.rate_limit.per_agent = RateLimitRule{2, std::chrono::hours(1)};
    build();
    components.ledger->set_limit("agent-1", usd_to_micros(100.0));

    EXPECT_TRUE(gateway->handle(chat()).ok());
    EXPECT_TRUE(gateway->handle(chat()).ok());
    auto r = gateway->handle(chat());
    EXPECT_EQ(r.status, ResponseStatus::RateLimited);
    EXPECT_GT(r.retry_after, Duration::zero());
    EXPECT_EQ(openai->calls.load(), 2);
}

TEST_F(GatewayTest, UnknownCapability) {
    build();
    auto request = chat();
    request.capability = "vision";
    EXPECT_EQ(gateway->handle(request).status, ResponseStatus::UnknownCapability);
}

TEST_F(GatewayTest, NoBindingForAnyTier) {
    build();
    components.translator->unbind_all("agent-1");
    auto r = gateway->handle(chat());
    EXPECT_EQ(r.status, ResponseStatus::NoProviderBinding);
    EXPECT_EQ(remaining(), usd_to_micros(10.0));
}

TEST_F(GatewayTest, UnboundTierIsSkipped) {
    build();
    components.translator->unbind("agent-1", "openai");
    auto r = gateway->handle(chat());
    EXPECT_EQ(r.status, ResponseStatus::Ok);
    EXPECT_EQ(r.provider_id, "anthropic");
    EXPECT_EQ(openai->calls.load(), 0);
}

TEST_F(GatewayTest, EmptyPayloadIsInvalid) {
    build();
    auto request = chat();
    request.payload.clear();
    EXPECT_EQ(gateway->handle(request).status, ResponseStatus::InvalidRequest);
}

// ===========================================================================
// Vault outage
// ===========================================================================

TEST_F(GatewayTest, VaultOutageFailsClosedByDefault) {
    build();
    store->down = true;

    auto r = gateway->handle(chat());
    EXPECT_EQ(r.status, ResponseStatus::VaultUnavailable);
    EXPECT_EQ(openai->calls.load(), 0);
    EXPECT_EQ(anthropic->calls.load(), 0);
    EXPECT_EQ(remaining(), usd_to_micros(10.0));
}

TEST_F(GatewayTest, VaultOutageCanAdvanceInstead) {
    config.vault_failure_policy = VaultFailurePolicy::TryNextCandidate;
    build();
    store->down = true;

    auto r = gateway->handle(chat());
    EXPECT_EQ(r.status, ResponseStatus::AllProvidersUnavailable);
    EXPECT_EQ(openai->calls.load(), 0);
    EXPECT_EQ(anthropic->calls.load(), 0);
    EXPECT_EQ(remaining(), usd_to_micros(10.0));
}

// ===========================================================================
// Cancellation and deadlines
// ===========================================================================

TEST_F(GatewayTest, CancelledBeforeDispatch) {
    build();
    auto request = chat();
    request.cancel_flag = std::make_shared<std::atomic<bool>>(true);

    auto r = gateway->handle(request);
    EXPECT_EQ(r.status, ResponseStatus::Cancelled);
    EXPECT_EQ(openai->calls.load(), 0);
    EXPECT_EQ(remaining(), usd_to_micros(10.0));
}

TEST_F(GatewayTest, DeadlineAlreadyPassed) {
    build();
    auto request = chat();
    request.deadline = Clock::now() - 1ms;

    auto r = gateway->handle(request);
    EXPECT_EQ(r.status, ResponseStatus::DeadlineExceeded);
    EXPECT_EQ(openai->calls.load(), 0);
    EXPECT_EQ(remaining(), usd_to_micros(10.0));
}

TEST_F(GatewayTest, AttemptTimeoutBoundedByDeadline) {
    config.attempt_timeout = std::chrono::seconds(30);
    build();
    auto request = chat();
    request.deadline = Clock::now() + 2s;

    ASSERT_TRUE(gateway->handle(request).ok());
    EXPECT_LE(openai->last_request().timeout, Duration(2s));
}

TEST_F(GatewayTest, SlowProvidersStopBeforeTheHoldExpires) {
    config.ledger.reservation_ttl = 200ms;
    config.ledger.sweep_interval = 5ms;
    config.ledger.enable_expiry_sweep = true;
    config.attempt_timeout = 150ms;
    config.retry.max_attempts = 2;
    openai->delay = 400ms;
    anthropic->delay = 400ms;
    build();
    gateway->start();

    std::vector<std::future<InferenceResponse>> futures;
    for (int i = 0; i < 3; ++i) {
        futures.push_back(gateway->submit(chat()));
        std::this_thread::sleep_for(60ms);
    }
    // The third arrives while two holds are pending
    for (auto& f : futures) {
        auto status = f.get().status;
        EXPECT_TRUE(status == ResponseStatus::DeadlineExceeded ||
                    status == ResponseStatus::BudgetExceeded) << to_string(status);
    }
    gateway->stop();

    auto account = components.ledger->snapshot("agent-1");
    ASSERT_TRUE(account.has_value());
    EXPECT_LE(account->spent + account->pending, account->limit);
    EXPECT_EQ(remaining(), usd_to_micros(10.0));
    EXPECT_EQ(monitor->count_of(EventType::ReservationExpired), 0u);
    EXPECT_LE(openai->last_request().timeout, config.ledger.reservation_ttl);
    EXPECT_EQ(anthropic->calls.load(), 0);
}

TEST_F(GatewayTest, SecondModelOfSameProviderIsTried) {
    build();
    components.pricing->set_price("gpt-4o-mini", FOUR_DOLLAR_PRICE);
    components.selector->set_tiers("chat", {
        FallbackTier{"openai", "gpt-4o", 3.0, 0.9},
        FallbackTier{"openai", "gpt-4o-mini", 2.0, 0.8},
        FallbackTier{"anthropic", "claude-sonnet", 1.0, 0.9},
    });
    openai->queue(503);

    auto r = gateway->handle(chat());
    ASSERT_EQ(r.status, ResponseStatus::Ok);
    EXPECT_EQ(r.provider_id, "openai");
    EXPECT_EQ(r.model, "gpt-4o-mini");
    EXPECT_EQ(openai->calls.load(), 2);
    EXPECT_EQ(anthropic->calls.load(), 0);
}

// ===========================================================================
// Audit
// ===========================================================================

TEST_F(GatewayTest, PublishesAuditAndCostReport) {
    build();
    ASSERT_TRUE(gateway->handle(chat()).ok());
    components.audit->flush();

    ASSERT_EQ(sink->events.size(), 2u);
    EXPECT_EQ(sink->events[0].kind, AuditEventKind::CostReport);
    EXPECT_EQ(sink->events[0].actual_cost, usd_to_micros(4.0));
    EXPECT_EQ(sink->events[1].kind, AuditEventKind::Audit);
    EXPECT_EQ(sink->events[1].status, ResponseStatus::Ok);
    EXPECT_EQ(sink->events[1].providers_attempted, (std::vector<ProviderId>{"openai"}));
    EXPECT_EQ(sink->events[1].estimated_cost, usd_to_micros(4.0));
}

TEST_F(GatewayTest, RejectionsAreAuditedWithoutCostReport) {
    build();
    components.validator->revoke(token);
    gateway->handle(chat());
    components.audit->flush();

    ASSERT_EQ(sink->events.size(), 1u);
    EXPECT_EQ(sink->events[0].kind, AuditEventKind::Audit);
    EXPECT_EQ(sink->events[0].status, ResponseStatus::Revoked);
}

TEST_F(GatewayTest, StartStopLifecycle) {
    config.ledger.enable_expiry_sweep = true;
    build();
    gateway->start();
    EXPECT_TRUE(gateway->is_running());
    EXPECT_TRUE(gateway->handle(chat()).ok());
    gateway->stop();
    EXPECT_FALSE(gateway->is_running());
    EXPECT_EQ(sink->events.size(), 2u);
}

TEST(GatewayConstructionTest, RequiresComponents) {
    Config config;
    config.tokens.signing_secret = "s";
    EXPECT_THROW(Gateway(config, GatewayComponents{}), InvalidConfigException);
}
