#include "agentgate/crypto.hpp"
#include "agentgate/exceptions.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cstdlib>
#include <memory>

namespace agentgate::crypto {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

CipherCtxPtr new_cipher_ctx() {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) throw CryptoException("EVP_CIPHER_CTX_new failed");
    return ctx;
}

const unsigned char* as_uchar(std::string_view s) {
    return reinterpret_cast<const unsigned char*>(s.data());
}

} // anonymous namespace

Bytes random_bytes(std::size_t count) {
    Bytes out(count);
    if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        throw CryptoException("RAND_bytes failed");
    }
    return out;
}

std::string sha256_hex(std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        throw CryptoException("SHA-256 digest failed");
    }

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0f]);
    }
    return out;
}

Bytes hmac_sha256(std::string_view key, std::string_view data) {
    Bytes out(EVP_MAX_MD_SIZE);
    unsigned int out_len = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             as_uchar(data), data.size(), out.data(), &out_len) == nullptr) {
        throw CryptoException("HMAC-SHA256 failed");
    }
    out.resize(out_len);
    return out;
}

std::string base64_encode(const Bytes& data) {
    if (data.empty()) return {};
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

Bytes base64_decode(std::string_view text) {
    if (text.empty()) return {};
    if (text.size() % 4 != 0) {
        throw CryptoException("Invalid base64 length");
    }

    Bytes out(3 * text.size() / 4);
    int written = EVP_DecodeBlock(out.data(), as_uchar(text), static_cast<int>(text.size()));
    if (written < 0) {
        throw CryptoException("Invalid base64 encoding");
    }

    // EVP_DecodeBlock counts padding as zero bytes
    std::size_t padding = 0;
    if (text.back() == '=') ++padding;
    if (text.size() > 1 && text[text.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(written) - padding);
    return out;
}

std::string base64url_encode(const Bytes& data) {
    std::string out = base64_encode(data);
    for (auto& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    while (!out.empty() && out.back() == '=') out.pop_back();
    return out;
}

Bytes base64url_decode(std::string_view text) {
    std::string std_text(text);
    for (auto& c : std_text) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
        else if (c == '+' || c == '/' || c == '=') {
            throw CryptoException("Invalid base64url character");
        }
    }
    if (std_text.size() % 4 == 1) {
        throw CryptoException("Invalid base64url length");
    }
    while (std_text.size() % 4 != 0) std_text.push_back('=');
    return base64_decode(std_text);
}

bool constant_time_equals(const Bytes& a, const Bytes& b) noexcept {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

void secure_wipe(std::string& secret) noexcept {
    if (!secret.empty()) {
        OPENSSL_cleanse(secret.data(), secret.size());
    }
    secret.clear();
}

std::string mask_secret(std::string_view secret) {
    if (secret.size() <= 8) return "***";
    return std::string(secret.substr(0, 4)) + "..." +
           std::string(secret.substr(secret.size() - 3));
}

// ========== SecretCipher ==========

SecretCipher::SecretCipher(Bytes master_key)
    : key_(std::move(master_key))
{
    if (key_.size() != KEY_SIZE) {
        OPENSSL_cleanse(key_.data(), key_.size());
        throw CryptoException("Master key must be " + std::to_string(KEY_SIZE) + " bytes");
    }
}

SecretCipher::~SecretCipher() {
    if (!key_.empty()) {
        OPENSSL_cleanse(key_.data(), key_.size());
    }
}

SecretCipher::SecretCipher(SecretCipher&& other) noexcept
    : key_(std::move(other.key_)) {
    other.key_.clear();
}

SecretCipher& SecretCipher::operator=(SecretCipher&& other) noexcept {
    if (this != &other) {
        if (!key_.empty()) OPENSSL_cleanse(key_.data(), key_.size());
        key_ = std::move(other.key_);
        other.key_.clear();
    }
    return *this;
}

SecretCipher SecretCipher::from_env(const char* variable) {
    const char* value = std::getenv(variable);
    if (value == nullptr || *value == '\0') {
        throw CryptoException(std::string("Master key not set: environment variable ") +
                              variable + " not found");
    }
    return SecretCipher(base64_decode(value));
}

EncryptedSecret SecretCipher::seal(std::string_view plaintext, std::string_view aad) const {
    EncryptedSecret sealed;
    Bytes nonce = random_bytes(NONCE_SIZE);
    std::copy(nonce.begin(), nonce.end(), sealed.nonce.begin());

    auto ctx = new_cipher_ctx();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), sealed.nonce.data()) != 1) {
        throw CryptoException("AES-256-GCM initialisation failed");
    }

    int len = 0;
    if (!aad.empty() &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, as_uchar(aad), static_cast<int>(aad.size())) != 1) {
        throw CryptoException("AES-256-GCM aad update failed");
    }

    sealed.ciphertext.resize(plaintext.size());
    int out_len = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), sealed.ciphertext.data(), &len,
                              as_uchar(plaintext), static_cast<int>(plaintext.size())) != 1) {
            throw CryptoException("AES-256-GCM encryption failed");
        }
        out_len = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), sealed.ciphertext.data() + out_len, &len) != 1) {
        throw CryptoException("AES-256-GCM finalisation failed");
    }
    out_len += len;
    sealed.ciphertext.resize(static_cast<std::size_t>(out_len));

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(TAG_SIZE), sealed.tag.data()) != 1) {
        throw CryptoException("AES-256-GCM tag extraction failed");
    }
    return sealed;
}

std::string SecretCipher::open(const EncryptedSecret& sealed, std::string_view aad) const {
    auto ctx = new_cipher_ctx();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), sealed.nonce.data()) != 1) {
        throw CryptoException("AES-256-GCM initialisation failed");
    }

    int len = 0;
    if (!aad.empty() &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, as_uchar(aad), static_cast<int>(aad.size())) != 1) {
        throw CryptoException("AES-256-GCM aad update failed");
    }

    std::string plaintext(sealed.ciphertext.size(), '\0');
    int out_len = 0;
    if (!sealed.ciphertext.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(plaintext.data()), &len,
                              sealed.ciphertext.data(),
                              static_cast<int>(sealed.ciphertext.size())) != 1) {
            secure_wipe(plaintext);
            throw CryptoException("AES-256-GCM decryption failed");
        }
        out_len = len;
    }

    std::array<std::uint8_t, TAG_SIZE> tag = sealed.tag;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(TAG_SIZE), tag.data()) != 1) {
        secure_wipe(plaintext);
        throw CryptoException("AES-256-GCM tag setup failed");
    }
    if (EVP_DecryptFinal_ex(ctx.get(),
                            reinterpret_cast<unsigned char*>(plaintext.data()) + out_len,
                            &len) <= 0) {
        secure_wipe(plaintext);
        throw CryptoException("Decryption failed: wrong key or tampered ciphertext");
    }
    out_len += len;
    plaintext.resize(static_cast<std::size_t>(out_len));
    return plaintext;
}

} // namespace agentgate::crypto
