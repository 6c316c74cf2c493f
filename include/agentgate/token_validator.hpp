#pragma once

#include "agentgate/types.hpp"
#include "agentgate/config.hpp"
#include "agentgate/monitor.hpp"

#include <array>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentgate {

// Authoritative record for one issued token. Only the SHA-256 hash of the
// token is ever stored.
struct TokenRecord {
    std::string token_hash;
    AgentId agent_id;
    std::string name;
    std::vector<std::string> scopes;
    WallClock::time_point issued_at{};
    std::optional<WallClock::time_point> expires_at;
    bool revoked{false};
};

// Authoritative token store (owned by the provisioning service)
class TokenStore {
public:
    virtual ~TokenStore() = default;

    virtual void put(TokenRecord record) = 0;
    virtual std::optional<TokenRecord> find(const std::string& token_hash) = 0;
    virtual bool mark_revoked(const std::string& token_hash) = 0;
    virtual std::vector<TokenRecord> find_by_agent(const AgentId& agent_id) = 0;
};

class InMemoryTokenStore : public TokenStore {
public:
    void put(TokenRecord record) override;
    std::optional<TokenRecord> find(const std::string& token_hash) override;
    bool mark_revoked(const std::string& token_hash) override;
    std::vector<TokenRecord> find_by_agent(const AgentId& agent_id) override;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, TokenRecord> records_;
};

enum class ValidationStatus {
    Valid,
    Unauthenticated,
    Revoked
};

struct ValidationResult {
    ValidationStatus status{ValidationStatus::Unauthenticated};
    std::optional<AgentIdentity> identity;
    std::string reason;

    bool ok() const noexcept { return status == ValidationStatus::Valid; }
};

// Verifies agent-presented tokens and resolves identity + scope.
//
// Token layout: "<prefix>_<base64url(payload)>.<base64url(hmac)>" where
// payload is "<agent_id>:<nonce>" and hmac = HMAC-SHA256(signing_secret, payload).
// Store lookups are cached for revocation_cache_ttl; revocations issued
// through this object take effect immediately.
class TokenValidator {
public:
    explicit TokenValidator(TokenConfig config,
                            std::shared_ptr<TokenStore> store = std::make_shared<InMemoryTokenStore>());

    TokenValidator(const TokenValidator&) = delete;
    TokenValidator& operator=(const TokenValidator&) = delete;

    // ==================== Issuance ====================

    // Returns the plaintext token; it is not retrievable afterwards.
    // Throws AgentAlreadyRegisteredException if the agent holds an active token.
    std::string mint(const AgentId& agent_id,
                     std::string name,
                     std::vector<std::string> scopes,
                     std::optional<WallClock::time_point> expires_at = std::nullopt);

    // Issues a new token with the same identity and revokes the previous one.
    // Throws AgentNotFoundException if the agent has no active token.
    std::string rotate(const AgentId& agent_id);

    bool revoke(const std::string& token);
    std::size_t revoke_agent(const AgentId& agent_id);

    // ==================== Validation ====================

    ValidationResult validate(const std::string& token) const;

    void clear_cache();
    std::size_t cache_size() const;

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    struct CacheEntry {
        TokenRecord record;
        Timestamp fetched_at{};
    };

    TokenConfig config_;
    std::shared_ptr<TokenStore> store_;
    std::shared_ptr<Monitor> monitor_;

    // Serialises mint/rotate/revoke_agent per agent; the store has no
    // compare-and-set, so find-then-write must not interleave
    static constexpr std::size_t ISSUE_STRIPES = 32;
    std::array<std::mutex, ISSUE_STRIPES> issue_locks_;

    mutable std::mutex cache_mutex_;
    mutable std::unordered_map<std::string, CacheEntry> cache_;
    std::uint64_t cache_epoch_{0};

    std::mutex& issue_lock(const AgentId& agent_id);
    std::string issue(const AgentId& agent_id, TokenRecord record);
    std::optional<AgentId> verify_signature(const std::string& token) const;
    std::optional<TokenRecord> lookup(const std::string& token_hash) const;
    void evict(const std::string& token_hash);
};

inline const char* to_string(ValidationStatus s) {
    switch (s) {
        case ValidationStatus::Valid:           return "Valid";
        case ValidationStatus::Unauthenticated: return "Unauthenticated";
        case ValidationStatus::Revoked:         return "Revoked";
    }
    return "Unknown";
}

} // namespace agentgate
