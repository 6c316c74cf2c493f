#pragma once

#include "agentgate/types.hpp"
#include "agentgate/credential_vault.hpp"
#include "agentgate/monitor.hpp"

#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentgate {

enum class TranslationStatus {
    Ok,
    NoProviderBinding,
    VaultUnavailable
};

struct TranslationResult {
    TranslationStatus status{TranslationStatus::NoProviderBinding};
    std::optional<ProviderCredential> credential;
    std::string reason;

    bool ok() const noexcept { return status == TranslationStatus::Ok; }
};

// Maps an authenticated agent onto the provider credential it is allowed to
// use for one outbound call. The credential never leaves the request path.
class TokenTranslator {
public:
    explicit TokenTranslator(std::shared_ptr<CredentialVault> vault);

    TokenTranslator(const TokenTranslator&) = delete;
    TokenTranslator& operator=(const TokenTranslator&) = delete;

    // ==================== Bindings ====================

    void bind(const AgentId& agent_id, const ProviderId& provider_id);
    bool unbind(const AgentId& agent_id, const ProviderId& provider_id);
    void unbind_all(const AgentId& agent_id);
    bool is_bound(const AgentId& agent_id, const ProviderId& provider_id) const;
    std::vector<ProviderId> bound_providers(const AgentId& agent_id) const;

    // ==================== Translation ====================

    // A missing binding or a credential missing from the vault yields
    // NoProviderBinding. Unreachable store or failed decryption yields
    // VaultUnavailable; there is never a fallback to another credential.
    TranslationResult translate(const AgentId& agent_id, const ProviderId& provider_id) const;

private:
    std::shared_ptr<CredentialVault> vault_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<AgentId, std::set<ProviderId>> bindings_;
};

inline const char* to_string(TranslationStatus s) {
    switch (s) {
        case TranslationStatus::Ok:                return "Ok";
        case TranslationStatus::NoProviderBinding: return "NoProviderBinding";
        case TranslationStatus::VaultUnavailable:  return "VaultUnavailable";
    }
    return "Unknown";
}

} // namespace agentgate
