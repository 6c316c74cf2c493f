#include "agentgate/token_translator.hpp"
#include "agentgate/exceptions.hpp"

#include <mutex>

namespace agentgate {

TokenTranslator::TokenTranslator(std::shared_ptr<CredentialVault> vault)
    : vault_(std::move(vault))
{
    if (!vault_) {
        throw InvalidConfigException("TokenTranslator requires a credential vault");
    }
}

void TokenTranslator::bind(const AgentId& agent_id, const ProviderId& provider_id) {
    if (agent_id.empty() || provider_id.empty()) {
        throw InvalidRequestException("Binding requires an agent id and a provider id");
    }
    std::unique_lock lock(mutex_);
    bindings_[agent_id].insert(provider_id);
}

bool TokenTranslator::unbind(const AgentId& agent_id, const ProviderId& provider_id) {
    std::unique_lock lock(mutex_);
    auto it = bindings_.find(agent_id);
    if (it == bindings_.end()) return false;
    bool removed = it->second.erase(provider_id) > 0;
    if (it->second.empty()) {
        bindings_.erase(it);
    }
    return removed;
}

void TokenTranslator::unbind_all(const AgentId& agent_id) {
    std::unique_lock lock(mutex_);
    bindings_.erase(agent_id);
}

bool TokenTranslator::is_bound(const AgentId& agent_id, const ProviderId& provider_id) const {
    std::shared_lock lock(mutex_);
    auto it = bindings_.find(agent_id);
    return it != bindings_.end() && it->second.count(provider_id) > 0;
}

std::vector<ProviderId> TokenTranslator::bound_providers(const AgentId& agent_id) const {
    std::shared_lock lock(mutex_);
    auto it = bindings_.find(agent_id);
    if (it == bindings_.end()) return {};
    return std::vector<ProviderId>(it->second.begin(), it->second.end());
}

TranslationResult TokenTranslator::translate(const AgentId& agent_id,
                                             const ProviderId& provider_id) const {
    TranslationResult result;

    if (!is_bound(agent_id, provider_id)) {
        result.status = TranslationStatus::NoProviderBinding;
        result.reason = "Agent " + agent_id + " is not bound to provider " + provider_id;
        return result;
    }

    // Vault access happens outside the binding lock
    auto lookup = vault_->decrypt(provider_id);
    switch (lookup.status) {
        case VaultStatus::Ok:
            result.status = TranslationStatus::Ok;
            result.credential = std::move(lookup.credential);
            break;
        case VaultStatus::NotFound:
            result.status = TranslationStatus::NoProviderBinding;
            result.reason = lookup.reason;
            break;
        case VaultStatus::Unavailable:
        case VaultStatus::DecryptionFailed:
            result.status = TranslationStatus::VaultUnavailable;
            result.reason = lookup.reason;
            break;
    }
    return result;
}

} // namespace agentgate
