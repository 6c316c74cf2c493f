#include "agentgate/token_validator.hpp"
#include "agentgate/crypto.hpp"
#include "agentgate/exceptions.hpp"

#include <algorithm>

namespace agentgate {

namespace {

constexpr std::size_t NONCE_BYTES = 24;

std::string to_text(const crypto::Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

crypto::Bytes to_bytes(const std::string& text) {
    return crypto::Bytes(text.begin(), text.end());
}

} // anonymous namespace

// ========== InMemoryTokenStore ==========

void InMemoryTokenStore::put(TokenRecord record) {
    std::unique_lock lock(mutex_);
    auto hash = record.token_hash;
    records_[hash] = std::move(record);
}

std::optional<TokenRecord> InMemoryTokenStore::find(const std::string& token_hash) {
    std::shared_lock lock(mutex_);
    auto it = records_.find(token_hash);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

bool InMemoryTokenStore::mark_revoked(const std::string& token_hash) {
    std::unique_lock lock(mutex_);
    auto it = records_.find(token_hash);
    if (it == records_.end() || it->second.revoked) return false;
    it->second.revoked = true;
    return true;
}

std::vector<TokenRecord> InMemoryTokenStore::find_by_agent(const AgentId& agent_id) {
    std::shared_lock lock(mutex_);
    std::vector<TokenRecord> result;
    for (auto& [_, record] : records_) {
        if (record.agent_id == agent_id) {
            result.push_back(record);
        }
    }
    return result;
}

// ========== TokenValidator ==========

TokenValidator::TokenValidator(TokenConfig config, std::shared_ptr<TokenStore> store)
    : config_(std::move(config))
    , store_(std::move(store))
{
    if (config_.signing_secret.empty()) {
        throw InvalidConfigException("Token signing secret must not be empty");
    }
    if (!store_) {
        throw InvalidConfigException("TokenValidator requires a token store");
    }
}

std::string TokenValidator::mint(const AgentId& agent_id,
                                 std::string name,
                                 std::vector<std::string> scopes,
                                 std::optional<WallClock::time_point> expires_at) {
    if (agent_id.empty() || agent_id.find(':') != std::string::npos) {
        throw InvalidRequestException("Invalid agent id: '" + agent_id + "'");
    }

    std::lock_guard<std::mutex> guard(issue_lock(agent_id));
    for (auto& existing : store_->find_by_agent(agent_id)) {
        if (!existing.revoked) {
            throw AgentAlreadyRegisteredException(agent_id);
        }
    }

    TokenRecord record;
    record.agent_id = agent_id;
    record.name = std::move(name);
    record.scopes = std::move(scopes);
    record.expires_at = expires_at;

    auto token = issue(agent_id, std::move(record));
    auto event = make_event(EventType::TokenMinted, "Token minted");
    event.agent_id = agent_id;
    emit(std::atomic_load(&monitor_), std::move(event));
    return token;
}

std::string TokenValidator::rotate(const AgentId& agent_id) {
    std::lock_guard<std::mutex> guard(issue_lock(agent_id));
    std::optional<TokenRecord> active;
    for (auto& existing : store_->find_by_agent(agent_id)) {
        if (!existing.revoked) {
            active = existing;
            break;
        }
    }
    if (!active.has_value()) {
        throw AgentNotFoundException(agent_id);
    }

    // Old token stops validating before the new one is handed out
    store_->mark_revoked(active->token_hash);
    evict(active->token_hash);

    TokenRecord record;
    record.agent_id = agent_id;
    record.name = active->name;
    record.scopes = active->scopes;
    record.expires_at = active->expires_at;

    auto token = issue(agent_id, std::move(record));
    auto event = make_event(EventType::TokenRotated, "Token rotated; previous token revoked");
    event.agent_id = agent_id;
    emit(std::atomic_load(&monitor_), std::move(event));
    return token;
}

bool TokenValidator::revoke(const std::string& token) {
    auto hash = crypto::sha256_hex(token);
    bool revoked = store_->mark_revoked(hash);
    evict(hash);
    if (revoked) {
        auto event = make_event(EventType::TokenRevoked, "Token revoked");
        if (auto agent = verify_signature(token)) event.agent_id = *agent;
        emit(std::atomic_load(&monitor_), std::move(event));
    }
    return revoked;
}

std::size_t TokenValidator::revoke_agent(const AgentId& agent_id) {
    std::lock_guard<std::mutex> guard(issue_lock(agent_id));
    std::size_t count = 0;
    for (auto& record : store_->find_by_agent(agent_id)) {
        if (!record.revoked && store_->mark_revoked(record.token_hash)) {
            ++count;
        }
        evict(record.token_hash);
    }
    if (count > 0) {
        auto event = make_event(EventType::TokenRevoked,
                                "Revoked " + std::to_string(count) + " token(s)");
        event.agent_id = agent_id;
        emit(std::atomic_load(&monitor_), std::move(event));
    }
    return count;
}

std::mutex& TokenValidator::issue_lock(const AgentId& agent_id) {
    return issue_locks_[std::hash<AgentId>{}(agent_id) % ISSUE_STRIPES];
}

ValidationResult TokenValidator::validate(const std::string& token) const {
    ValidationResult result;

    auto signed_agent = verify_signature(token);
    if (!signed_agent.has_value()) {
        result.status = ValidationStatus::Unauthenticated;
        result.reason = "Malformed token or bad signature";
        return result;
    }

    auto hash = crypto::sha256_hex(token);
    auto record = lookup(hash);
    if (!record.has_value() || record->agent_id != *signed_agent) {
        result.status = ValidationStatus::Unauthenticated;
        result.reason = "Unknown token";
        return result;
    }

    if (record->revoked) {
        result.status = ValidationStatus::Revoked;
        result.reason = "Token has been revoked";
        return result;
    }

    if (record->expires_at.has_value() && WallClock::now() >= *record->expires_at) {
        result.status = ValidationStatus::Unauthenticated;
        result.reason = "Token expired";
        return result;
    }

    AgentIdentity identity;
    identity.agent_id = record->agent_id;
    identity.name = record->name;
    identity.scopes = record->scopes;

    result.status = ValidationStatus::Valid;
    result.identity = std::move(identity);
    return result;
}

void TokenValidator::clear_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.clear();
    ++cache_epoch_;
}

std::size_t TokenValidator::cache_size() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.size();
}

void TokenValidator::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::atomic_store(&monitor_, std::move(monitor));
}

// ==================== Internal Helpers ====================

std::string TokenValidator::issue(const AgentId& agent_id, TokenRecord record) {
    std::string payload = agent_id + ":" + crypto::base64url_encode(crypto::random_bytes(NONCE_BYTES));
    auto signature = crypto::hmac_sha256(config_.signing_secret, payload);

    std::string token = config_.token_prefix + "_" +
                        crypto::base64url_encode(to_bytes(payload)) + "." +
                        crypto::base64url_encode(signature);

    record.token_hash = crypto::sha256_hex(token);
    record.issued_at = WallClock::now();
    record.revoked = false;
    store_->put(std::move(record));
    return token;
}

std::optional<AgentId> TokenValidator::verify_signature(const std::string& token) const {
    const std::string prefix = config_.token_prefix + "_";
    if (token.size() <= prefix.size() || token.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    auto dot = token.rfind('.');
    if (dot == std::string::npos || dot <= prefix.size() || dot + 1 >= token.size()) {
        return std::nullopt;
    }

    std::string payload;
    crypto::Bytes presented;
    try {
        payload = to_text(crypto::base64url_decode(
            std::string_view(token).substr(prefix.size(), dot - prefix.size())));
        presented = crypto::base64url_decode(std::string_view(token).substr(dot + 1));
    } catch (const CryptoException&) {
        return std::nullopt;
    }

    auto expected = crypto::hmac_sha256(config_.signing_secret, payload);
    if (!crypto::constant_time_equals(expected, presented)) {
        return std::nullopt;
    }

    auto colon = payload.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        return std::nullopt;
    }
    return payload.substr(0, colon);
}

std::optional<TokenRecord> TokenValidator::lookup(const std::string& token_hash) const {
    auto now = Clock::now();
    std::uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(token_hash);
        if (it != cache_.end() && now - it->second.fetched_at < config_.revocation_cache_ttl) {
            return it->second.record;
        }
        epoch = cache_epoch_;
    }

    // Outside the lock: the store may be remote
    auto record = store_->find(token_hash);
    if (!record.has_value()) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(cache_mutex_);
    // A revocation that raced the fetch must not be masked by a stale entry
    if (epoch == cache_epoch_) {
        cache_[token_hash] = CacheEntry{*record, now};
    }
    return record;
}

void TokenValidator::evict(const std::string& token_hash) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.erase(token_hash);
    ++cache_epoch_;
}

} // namespace agentgate
