#pragma once

#include "agentgate/types.hpp"
#include "agentgate/crypto.hpp"
#include "agentgate/monitor.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentgate {

// Plaintext provider secret for a single outbound call.
// Move-only, not streamable, wiped on destruction.
class ProviderCredential {
public:
    ProviderCredential(ProviderId provider_id, std::string secret);
    ~ProviderCredential();

    ProviderCredential(const ProviderCredential&) = delete;
    ProviderCredential& operator=(const ProviderCredential&) = delete;
    ProviderCredential(ProviderCredential&& other) noexcept;
    ProviderCredential& operator=(ProviderCredential&& other) noexcept;

    const ProviderId& provider_id() const noexcept;

    // Only adapters building the outbound request should read this
    const std::string& secret() const noexcept;

    // Safe for logs
    std::string masked() const;

private:
    ProviderId provider_id_;
    std::string secret_;
};

// Backing storage for sealed credentials. Remote implementations throw
// VaultUnavailableException when the store cannot be reached.
class CredentialStore {
public:
    virtual ~CredentialStore() = default;

    virtual void put(const ProviderId& provider_id, crypto::EncryptedSecret sealed) = 0;
    virtual std::optional<crypto::EncryptedSecret> get(const ProviderId& provider_id) = 0;
    virtual bool remove(const ProviderId& provider_id) = 0;
    virtual std::vector<ProviderId> list() = 0;
};

class InMemoryCredentialStore : public CredentialStore {
public:
    void put(const ProviderId& provider_id, crypto::EncryptedSecret sealed) override;
    std::optional<crypto::EncryptedSecret> get(const ProviderId& provider_id) override;
    bool remove(const ProviderId& provider_id) override;
    std::vector<ProviderId> list() override;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<ProviderId, crypto::EncryptedSecret> entries_;
};

enum class VaultStatus {
    Ok,
    NotFound,
    Unavailable,
    DecryptionFailed
};

struct VaultLookup {
    VaultStatus status{VaultStatus::NotFound};
    std::optional<ProviderCredential> credential;
    std::string reason;
};

// Holds encrypted provider credentials; decrypt-by-provider-id.
class CredentialVault {
public:
    CredentialVault(crypto::SecretCipher cipher,
                    std::shared_ptr<CredentialStore> store = std::make_shared<InMemoryCredentialStore>());

    CredentialVault(const CredentialVault&) = delete;
    CredentialVault& operator=(const CredentialVault&) = delete;

    // Administrative: seal and store (replaces an existing entry)
    void register_credential(const ProviderId& provider_id, std::string plaintext);
    bool remove_credential(const ProviderId& provider_id);
    std::vector<ProviderId> registered_providers();

    VaultLookup decrypt(const ProviderId& provider_id) const;

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    crypto::SecretCipher cipher_;
    std::shared_ptr<CredentialStore> store_;
    std::shared_ptr<Monitor> monitor_;
};

inline const char* to_string(VaultStatus s) {
    switch (s) {
        case VaultStatus::Ok:               return "Ok";
        case VaultStatus::NotFound:         return "NotFound";
        case VaultStatus::Unavailable:      return "Unavailable";
        case VaultStatus::DecryptionFailed: return "DecryptionFailed";
    }
    return "Unknown";
}

} // namespace agentgate
