#include "agentgate/credential_vault.hpp"
#include "agentgate/exceptions.hpp"

#include <mutex>

namespace agentgate {

// ========== ProviderCredential ==========

ProviderCredential::ProviderCredential(ProviderId provider_id, std::string secret)
    : provider_id_(std::move(provider_id))
    , secret_(std::move(secret))
{}

ProviderCredential::~ProviderCredential() {
    crypto::secure_wipe(secret_);
}

ProviderCredential::ProviderCredential(ProviderCredential&& other) noexcept
    : provider_id_(std::move(other.provider_id_))
    , secret_(std::move(other.secret_))
{
    other.secret_.clear();
}

ProviderCredential& ProviderCredential::operator=(ProviderCredential&& other) noexcept {
    if (this != &other) {
        crypto::secure_wipe(secret_);
        provider_id_ = std::move(other.provider_id_);
        secret_ = std::move(other.secret_);
        other.secret_.clear();
    }
    return *this;
}

const ProviderId& ProviderCredential::provider_id() const noexcept { return provider_id_; }
const std::string& ProviderCredential::secret() const noexcept { return secret_; }

std::string ProviderCredential::masked() const {
    return crypto::mask_secret(secret_);
}

// ========== InMemoryCredentialStore ==========

void InMemoryCredentialStore::put(const ProviderId& provider_id, crypto::EncryptedSecret sealed) {
    std::unique_lock lock(mutex_);
    entries_[provider_id] = std::move(sealed);
}

std::optional<crypto::EncryptedSecret> InMemoryCredentialStore::get(const ProviderId& provider_id) {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(provider_id);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

bool InMemoryCredentialStore::remove(const ProviderId& provider_id) {
    std::unique_lock lock(mutex_);
    return entries_.erase(provider_id) > 0;
}

std::vector<ProviderId> InMemoryCredentialStore::list() {
    std::shared_lock lock(mutex_);
    std::vector<ProviderId> ids;
    ids.reserve(entries_.size());
    for (auto& [id, _] : entries_) {
        ids.push_back(id);
    }
    return ids;
}

// ========== CredentialVault ==========

CredentialVault::CredentialVault(crypto::SecretCipher cipher,
                                 std::shared_ptr<CredentialStore> store)
    : cipher_(std::move(cipher))
    , store_(std::move(store))
{
    if (!store_) {
        throw InvalidConfigException("CredentialVault requires a credential store");
    }
}

void CredentialVault::register_credential(const ProviderId& provider_id, std::string plaintext) {
    if (provider_id.empty()) {
        crypto::secure_wipe(plaintext);
        throw InvalidRequestException("Provider id must not be empty");
    }
    // Provider id is bound as associated data so entries cannot be swapped
    auto sealed = cipher_.seal(plaintext, provider_id);
    std::string masked = crypto::mask_secret(plaintext);
    crypto::secure_wipe(plaintext);

    store_->put(provider_id, std::move(sealed));

    auto event = make_event(EventType::CredentialRegistered, "Credential stored (" + masked + ")");
    event.provider_id = provider_id;
    emit(std::atomic_load(&monitor_), std::move(event));
}

bool CredentialVault::remove_credential(const ProviderId& provider_id) {
    return store_->remove(provider_id);
}

std::vector<ProviderId> CredentialVault::registered_providers() {
    return store_->list();
}

VaultLookup CredentialVault::decrypt(const ProviderId& provider_id) const {
    VaultLookup lookup;

    std::optional<crypto::EncryptedSecret> sealed;
    try {
        sealed = store_->get(provider_id);
    } catch (const VaultUnavailableException& e) {
        lookup.status = VaultStatus::Unavailable;
        lookup.reason = e.what();
        auto event = make_event(EventType::VaultUnavailable, lookup.reason);
        event.provider_id = provider_id;
        emit(std::atomic_load(&monitor_), std::move(event));
        return lookup;
    }

    if (!sealed.has_value()) {
        lookup.status = VaultStatus::NotFound;
        lookup.reason = "No credential registered for provider " + provider_id;
        return lookup;
    }

    try {
        lookup.credential.emplace(provider_id, cipher_.open(*sealed, provider_id));
        lookup.status = VaultStatus::Ok;
    } catch (const CryptoException& e) {
        lookup.status = VaultStatus::DecryptionFailed;
        lookup.reason = e.what();
    }
    return lookup;
}

void CredentialVault::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::atomic_store(&monitor_, std::move(monitor));
}

} // namespace agentgate
