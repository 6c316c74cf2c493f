#pragma once

#include "agentgate/types.hpp"
#include "agentgate/credential_vault.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace agentgate {

// ==================== Transport ====================

struct HttpRequest {
    std::string method = "POST";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    Duration timeout{std::chrono::seconds(30)};
};

struct HttpResponse {
    int status{0};
    std::string body;
    bool timed_out{false};
};

// Outbound HTTP client seam. Implementations honour request.timeout and
// throw TransportException when no response could be obtained.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

// ==================== Adapters ====================

enum class AttemptOutcome {
    Success,
    Retryable,          // timeout, 408, 429, 5xx, malformed body, connection error
    CredentialRejected, // 401 / 403
    Rejected            // any other 4xx: the payload itself is refused
};

struct ProviderCall {
    std::string model;
    std::string payload;
    std::uint32_t max_output_tokens{0};
    Duration timeout{std::chrono::seconds(30)};
};

struct ProviderResult {
    AttemptOutcome outcome{AttemptOutcome::Retryable};
    int http_status{0};
    std::string body;
    TokenUsage usage;
    std::string error;

    bool ok() const noexcept { return outcome == AttemptOutcome::Success; }
};

// One upstream LLM provider. Subclasses supply the provider-native request
// shape and usage extraction; invoke() owns transport and classification.
class ProviderAdapter {
public:
    ProviderAdapter(ProviderId id, std::string base_url, std::shared_ptr<HttpTransport> transport);
    virtual ~ProviderAdapter() = default;

    ProviderAdapter(const ProviderAdapter&) = delete;
    ProviderAdapter& operator=(const ProviderAdapter&) = delete;

    ProviderResult invoke(const ProviderCall& call, const ProviderCredential& credential);

    const ProviderId& id() const noexcept { return id_; }
    const std::string& base_url() const noexcept { return base_url_; }
    virtual std::string kind() const = 0;

protected:
    virtual HttpRequest build_request(const ProviderCall& call,
                                      const ProviderCredential& credential) const = 0;

    // Returns false if the body carries no usable usage block
    virtual bool parse_usage(const std::string& body, TokenUsage& usage) const = 0;

private:
    ProviderId id_;
    std::string base_url_;
    std::shared_ptr<HttpTransport> transport_;
};

// Chat Completions API: Bearer auth, usage.prompt_tokens / completion_tokens
class OpenAiAdapter : public ProviderAdapter {
public:
    OpenAiAdapter(ProviderId id, std::shared_ptr<HttpTransport> transport,
                  std::string base_url = "https://api.openai.com");

    std::string kind() const override { return "openai"; }

protected:
    HttpRequest build_request(const ProviderCall& call,
                              const ProviderCredential& credential) const override;
    bool parse_usage(const std::string& body, TokenUsage& usage) const override;
};

// Messages API: x-api-key auth, usage.input_tokens / output_tokens
class AnthropicAdapter : public ProviderAdapter {
public:
    static constexpr const char* API_VERSION = "2023-06-01";

    AnthropicAdapter(ProviderId id, std::shared_ptr<HttpTransport> transport,
                     std::string base_url = "https://api.anthropic.com");

    std::string kind() const override { return "anthropic"; }

protected:
    HttpRequest build_request(const ProviderCall& call,
                              const ProviderCredential& credential) const override;
    bool parse_usage(const std::string& body, TokenUsage& usage) const override;
};

// Provider id -> adapter
class ProviderRegistry {
public:
    void register_adapter(std::shared_ptr<ProviderAdapter> adapter);
    bool unregister_adapter(const ProviderId& id);

    std::shared_ptr<ProviderAdapter> find(const ProviderId& id) const;

    // Throws ProviderNotFoundException
    std::shared_ptr<ProviderAdapter> get(const ProviderId& id) const;

    std::vector<ProviderId> providers() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<ProviderId, std::shared_ptr<ProviderAdapter>> adapters_;
};

// Reads the two token counts from the top-level "usage" object of a JSON
// body. A null count reads as zero; a missing or non-integer count fails.
bool read_usage(const std::string& body, const char* input_key, const char* output_key,
                TokenUsage& usage);

inline const char* to_string(AttemptOutcome o) {
    switch (o) {
        case AttemptOutcome::Success:            return "Success";
        case AttemptOutcome::Retryable:          return "Retryable";
        case AttemptOutcome::CredentialRejected: return "CredentialRejected";
        case AttemptOutcome::Rejected:           return "Rejected";
    }
    return "Unknown";
}

} // namespace agentgate
