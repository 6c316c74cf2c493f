#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace agentgate::crypto {

using Bytes = std::vector<std::uint8_t>;

constexpr std::size_t KEY_SIZE = 32;
constexpr std::size_t NONCE_SIZE = 12;
constexpr std::size_t TAG_SIZE = 16;

constexpr const char* MASTER_KEY_ENV_VAR = "AGENTGATE_VAULT_MASTER_KEY";

// CSPRNG output; throws CryptoException if the generator fails
Bytes random_bytes(std::size_t count);

std::string sha256_hex(std::string_view data);
Bytes hmac_sha256(std::string_view key, std::string_view data);

std::string base64_encode(const Bytes& data);
Bytes base64_decode(std::string_view text);

// URL-safe alphabet, no padding
std::string base64url_encode(const Bytes& data);
Bytes base64url_decode(std::string_view text);

bool constant_time_equals(const Bytes& a, const Bytes& b) noexcept;

// Overwrites the buffer contents before it is released
void secure_wipe(std::string& secret) noexcept;

// "sk-proj-abcdef123" -> "sk-p...123"; short secrets become "***"
std::string mask_secret(std::string_view secret);

struct EncryptedSecret {
    Bytes ciphertext;
    std::array<std::uint8_t, NONCE_SIZE> nonce{};
    std::array<std::uint8_t, TAG_SIZE> tag{};
};

// AES-256-GCM sealing of credential material under a master key.
// A fresh random nonce is drawn for every seal().
class SecretCipher {
public:
    explicit SecretCipher(Bytes master_key);
    ~SecretCipher();

    SecretCipher(const SecretCipher&) = delete;
    SecretCipher& operator=(const SecretCipher&) = delete;
    SecretCipher(SecretCipher&& other) noexcept;
    SecretCipher& operator=(SecretCipher&& other) noexcept;

    // Reads a base64-encoded 32-byte key from the named environment variable
    static SecretCipher from_env(const char* variable = MASTER_KEY_ENV_VAR);

    // `aad` binds the ciphertext to its context (e.g. the provider id)
    EncryptedSecret seal(std::string_view plaintext, std::string_view aad) const;

    // Throws CryptoException on a wrong key, wrong aad or tampered data
    std::string open(const EncryptedSecret& sealed, std::string_view aad) const;

private:
    Bytes key_;
};

} // namespace agentgate::crypto
