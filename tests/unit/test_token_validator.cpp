#include <gtest/gtest.h>
#include <agentgate/agentgate.hpp>

#include <atomic>
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

// ===========================================================================
// Fixture
// ===========================================================================

class TokenValidatorTest : public ::testing::Test {
protected:
    TokenConfig cfg;
    std::shared_ptr<InMemoryTokenStore> store = std::make_shared<InMemoryTokenStore>();
    std::shared_ptr<TestMonitor> monitor = std::make_shared<TestMonitor>();
    std::unique_ptr<TokenValidator> validator;

    void SetUp() override {
        cfg.signing_secret = "unit-test-secret";
        cfg.revocation_cache_ttl = 50ms;
        validator = std::make_unique<TokenValidator>(cfg, store);
        validator->set_monitor(monitor);
    }
};

// ===========================================================================
// Minting and validation
// ===========================================================================

TEST_F(TokenValidatorTest, MintedTokenValidates) {
    auto token = validator->mint("agent-1", "Research Agent", {"llm:call", "llm:embed"});

    EXPECT_EQ(token.rfind("agk_", 0), 0u);

    auto result = validator->validate(token);
    ASSERT_TRUE(result.ok());
    ASSERT_TRUE(result.identity.has_value());
    EXPECT_EQ(result.identity->agent_id, "agent-1");
    EXPECT_EQ(result.identity->name, "Research Agent");
    EXPECT_TRUE(result.identity->has_scope("llm:call"));
    EXPECT_FALSE(result.identity->has_scope("admin"));
    EXPECT_EQ(monitor->count_of(EventType::TokenMinted), 1u);
}

TEST_F(TokenValidatorTest, StoreKeepsOnlyHash) {
    auto token = validator->mint("agent-1", "A", {"llm:call"});
    auto records = store->find_by_agent("agent-1");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].token_hash, crypto::sha256_hex(token));
    EXPECT_NE(records[0].token_hash, token);
}

TEST_F(TokenValidatorTest, GarbageIsUnauthenticated) {
    EXPECT_EQ(validator->validate("").status, ValidationStatus::Unauthenticated);
    EXPECT_EQ(validator->validate("agk_").status, ValidationStatus::Unauthenticated);
    EXPECT_EQ(validator->validate("agk_abc.def").status, ValidationStatus::Unauthenticated);
    EXPECT_EQ(validator->validate("Bearer nonsense").status, ValidationStatus::Unauthenticated);
}

TEST_F(TokenValidatorTest, TamperedSignatureIsUnauthenticated) {
    auto token = validator->mint("agent-1", "A", {"llm:call"});
    auto sig = token.rfind('.') + 1;
    token[sig] = token[sig] == 'A' ? 'B' : 'A';
    EXPECT_EQ(validator->validate(token).status, ValidationStatus::Unauthenticated);
}

TEST_F(TokenValidatorTest, TokenFromOtherSecretIsUnauthenticated) {
    TokenConfig other_cfg = cfg;
    other_cfg.signing_secret = "other-secret";
    TokenValidator other(other_cfg);
    auto foreign = other.mint("agent-1", "A", {"llm:call"});

    EXPECT_EQ(validator->validate(foreign).status, ValidationStatus::Unauthenticated);
}

TEST_F(TokenValidatorTest, ValidSignatureButUnknownTokenIsUnauthenticated) {
    auto token = validator->mint("agent-1", "A", {"llm:call"});
    // A second validator sharing the secret but not the store
    TokenValidator detached(cfg);
    EXPECT_EQ(detached.validate(token).status, ValidationStatus::Unauthenticated);
}

TEST_F(TokenValidatorTest, ExpiredTokenIsUnauthenticated) {
    auto token = validator->mint("agent-1", "A", {"llm:call"},
                                 WallClock::now() - std::chrono::seconds(1));
    auto result = validator->validate(token);
    EXPECT_EQ(result.status, ValidationStatus::Unauthenticated);
    EXPECT_EQ(result.reason, "Token expired");
}

TEST_F(TokenValidatorTest, SecondActiveTokenForAgentRejected) {
    validator->mint("agent-1", "A", {"llm:call"});
    EXPECT_THROW(validator->mint("agent-1", "A", {"llm:call"}), AgentAlreadyRegisteredException);
}

TEST_F(TokenValidatorTest, InvalidAgentIdRejected) {
    EXPECT_THROW(validator->mint("", "A", {}), InvalidRequestException);
    EXPECT_THROW(validator->mint("a:b", "A", {}), InvalidRequestException);
}

TEST(TokenValidatorConfigTest, EmptySecretRejected) {
    EXPECT_THROW(TokenValidator(TokenConfig{}), InvalidConfigException);
}

// ===========================================================================
// Revocation and rotation
// ===========================================================================

TEST_F(TokenValidatorTest, RevokeTakesEffectImmediately) {
    auto token = validator->mint("agent-1", "A", {"llm:call"});
    ASSERT_TRUE(validator->validate(token).ok());  // now cached

    EXPECT_TRUE(validator->revoke(token));
    EXPECT_EQ(validator->validate(token).status, ValidationStatus::Revoked);
    EXPECT_FALSE(validator->revoke(token));
    EXPECT_EQ(monitor->count_of(EventType::TokenRevoked), 1u);
}

TEST_F(TokenValidatorTest, ExternalRevocationVisibleAfterCacheTtl) {
    auto token = validator->mint("agent-1", "A", {"llm:call"});
    ASSERT_TRUE(validator->validate(token).ok());
    EXPECT_EQ(validator->cache_size(), 1u);

    // Revoked by the provisioning service, not through this validator
    store->mark_revoked(crypto::sha256_hex(token));
    EXPECT_TRUE(validator->validate(token).ok());

    std::this_thread::sleep_for(80ms);
    EXPECT_EQ(validator->validate(token).status, ValidationStatus::Revoked);
}

TEST_F(TokenValidatorTest, ClearCacheForcesStoreLookup) {
    auto token = validator->mint("agent-1", "A", {"llm:call"});
    ASSERT_TRUE(validator->validate(token).ok());

    store->mark_revoked(crypto::sha256_hex(token));
    validator->clear_cache();
    EXPECT_EQ(validator->cache_size(), 0u);
    EXPECT_EQ(validator->validate(token).status, ValidationStatus::Revoked);
}

TEST_F(TokenValidatorTest, RotateRevokesOldToken) {
    auto old_token = validator->mint("agent-1", "Research", {"llm:call"});
    ASSERT_TRUE(validator->validate(old_token).ok());

    auto new_token = validator->rotate("agent-1");
    EXPECT_NE(old_token, new_token);

    EXPECT_EQ(validator->validate(old_token).status, ValidationStatus::Revoked);
    auto result = validator->validate(new_token);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.identity->name, "Research");
    EXPECT_TRUE(result.identity->has_scope("llm:call"));
    EXPECT_EQ(monitor->count_of(EventType::TokenRotated), 1u);
}

TEST_F(TokenValidatorTest, RotateUnknownAgentThrows) {
    EXPECT_THROW(validator->rotate("nobody"), AgentNotFoundException);
}

TEST_F(TokenValidatorTest, RevokeAgentAllowsReminting) {
    auto token = validator->mint("agent-1", "A", {"llm:call"});
    EXPECT_EQ(validator->revoke_agent("agent-1"), 1u);
    EXPECT_EQ(validator->validate(token).status, ValidationStatus::Revoked);

    auto fresh = validator->mint("agent-1", "A", {"llm:call"});
    EXPECT_TRUE(validator->validate(fresh).ok());
}

// ===========================================================================
// Concurrent issuance
// ===========================================================================

// Agent lookups take as long as a round trip to a remote store
class SlowTokenStore : public InMemoryTokenStore {
public:
    std::vector<TokenRecord> find_by_agent(const AgentId& agent_id) override {
        std::this_thread::sleep_for(2ms);
        return InMemoryTokenStore::find_by_agent(agent_id);
    }
};

namespace {

std::size_t active_tokens(TokenStore& store, const AgentId& agent_id) {
    std::size_t n = 0;
    for (auto& record : store.find_by_agent(agent_id)) {
        if (!record.revoked) ++n;
    }
    return n;
}

} // anonymous namespace

TEST(TokenValidatorConcurrencyTest, ConcurrentRotateLeavesOneActiveToken) {
    TokenConfig cfg;
    cfg.signing_secret = "unit-test-secret";
    auto store = std::make_shared<SlowTokenStore>();
    TokenValidator validator(cfg, store);

    for (int round = 0; round < 20; ++round) {
        AgentId agent = "agent-" + std::to_string(round);
        validator.mint(agent, "Rotating", {"llm:call"});

        std::string first, second;
        std::thread a([&] { first = validator.rotate(agent); });
        std::thread b([&] { second = validator.rotate(agent); });
        a.join();
        b.join();

        EXPECT_EQ(active_tokens(*store, agent), 1u) << "round " << round;
        int valid = (validator.validate(first).ok() ? 1 : 0) +
                    (validator.validate(second).ok() ? 1 : 0);
        EXPECT_EQ(valid, 1) << "round " << round;
    }
}

TEST(TokenValidatorConcurrencyTest, ConcurrentMintIssuesOnce) {
    TokenConfig cfg;
    cfg.signing_secret = "unit-test-secret";
    auto store = std::make_shared<SlowTokenStore>();
    TokenValidator validator(cfg, store);

    std::atomic<int> minted{0};
    std::atomic<int> refused{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] {
            try {
                validator.mint("agent-1", "Once", {"llm:call"});
                minted++;
            } catch (const AgentAlreadyRegisteredException&) {
                refused++;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(minted.load(), 1);
    EXPECT_EQ(refused.load(), 3);
    EXPECT_EQ(active_tokens(*store, "agent-1"), 1u);
}
