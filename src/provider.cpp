#include "agentgate/provider.hpp"
#include "agentgate/exceptions.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <mutex>

namespace agentgate {

namespace {

std::string trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

std::string chat_body(const ProviderCall& call, std::uint32_t max_tokens) {
    nlohmann::json body = {
        {"model", call.model},
        {"messages", nlohmann::json::array({
            {{"role", "user"}, {"content", call.payload}},
        })},
    };
    if (max_tokens > 0) {
        body["max_tokens"] = max_tokens;
    }
    return body.dump();
}

bool read_count(const nlohmann::json& usage, const char* key, std::uint64_t& value) {
    auto it = usage.find(key);
    if (it == usage.end()) return false;
    if (it->is_null()) {
        value = 0;
        return true;
    }
    // Counts past uint64 parse as floating point
    if (!it->is_number_unsigned()) return false;
    value = it->get<std::uint64_t>();
    return true;
}

} // anonymous namespace

// ========== Helpers ==========

bool read_usage(const std::string& body, const char* input_key, const char* output_key,
                TokenUsage& usage) {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) return false;

    auto it = parsed.find("usage");
    if (it == parsed.end() || !it->is_object()) return false;

    TokenUsage counts;
    if (!read_count(*it, input_key, counts.input_tokens) ||
        !read_count(*it, output_key, counts.output_tokens)) {
        return false;
    }
    usage = counts;
    return true;
}

// ========== ProviderAdapter ==========

ProviderAdapter::ProviderAdapter(ProviderId id, std::string base_url,
                                 std::shared_ptr<HttpTransport> transport)
    : id_(std::move(id))
    , base_url_(trim_trailing_slash(std::move(base_url)))
    , transport_(std::move(transport))
{
    if (id_.empty()) {
        throw InvalidConfigException("Provider id must not be empty");
    }
    if (!transport_) {
        throw InvalidConfigException("Provider " + id_ + " requires an HTTP transport");
    }
}

ProviderResult ProviderAdapter::invoke(const ProviderCall& call, const ProviderCredential& credential) {
    ProviderResult result;

    HttpResponse response;
    try {
        response = transport_->send(build_request(call, credential));
    } catch (const TransportException& e) {
        result.outcome = AttemptOutcome::Retryable;
        result.error = std::string("Transport error: ") + e.what();
        return result;
    }

    result.http_status = response.status;
    if (response.timed_out) {
        result.outcome = AttemptOutcome::Retryable;
        result.error = "Attempt timed out";
        return result;
    }

    const int status = response.status;
    if (status >= 200 && status < 300) {
        if (parse_usage(response.body, result.usage)) {
            result.outcome = AttemptOutcome::Success;
            result.body = std::move(response.body);
        } else {
            result.outcome = AttemptOutcome::Retryable;
            result.error = "Malformed response: no usage block";
        }
    } else if (status == 401 || status == 403) {
        result.outcome = AttemptOutcome::CredentialRejected;
        result.error = "Provider rejected credential (HTTP " + std::to_string(status) + ")";
    } else if (status == 408 || status == 429 || status >= 500) {
        result.outcome = AttemptOutcome::Retryable;
        result.error = "HTTP " + std::to_string(status);
    } else if (status >= 400) {
        result.outcome = AttemptOutcome::Rejected;
        result.error = "Provider rejected request (HTTP " + std::to_string(status) + ")";
        result.body = std::move(response.body);
    } else {
        result.outcome = AttemptOutcome::Retryable;
        result.error = "Unexpected HTTP status " + std::to_string(status);
    }
    return result;
}

// ========== OpenAiAdapter ==========

OpenAiAdapter::OpenAiAdapter(ProviderId id, std::shared_ptr<HttpTransport> transport,
                             std::string base_url)
    : ProviderAdapter(std::move(id), std::move(base_url), std::move(transport)) {}

HttpRequest OpenAiAdapter::build_request(const ProviderCall& call,
                                         const ProviderCredential& credential) const {
    HttpRequest request;
    request.url = base_url() + "/v1/chat/completions";
    request.timeout = call.timeout;
    request.headers = {
        {"Content-Type", "application/json"},
        {"Authorization", "Bearer " + credential.secret()},
    };
    request.body = chat_body(call, call.max_output_tokens);
    return request;
}

bool OpenAiAdapter::parse_usage(const std::string& body, TokenUsage& usage) const {
    return read_usage(body, "prompt_tokens", "completion_tokens", usage);
}

// ========== AnthropicAdapter ==========

AnthropicAdapter::AnthropicAdapter(ProviderId id, std::shared_ptr<HttpTransport> transport,
                                   std::string base_url)
    : ProviderAdapter(std::move(id), std::move(base_url), std::move(transport)) {}

HttpRequest AnthropicAdapter::build_request(const ProviderCall& call,
                                            const ProviderCredential& credential) const {
    HttpRequest request;
    request.url = base_url() + "/v1/messages";
    request.timeout = call.timeout;
    request.headers = {
        {"Content-Type", "application/json"},
        {"x-api-key", credential.secret()},
        {"anthropic-version", API_VERSION},
    };
    // The Messages API requires max_tokens
    request.body = chat_body(call, call.max_output_tokens > 0 ? call.max_output_tokens : 1024);
    return request;
}

bool AnthropicAdapter::parse_usage(const std::string& body, TokenUsage& usage) const {
    return read_usage(body, "input_tokens", "output_tokens", usage);
}

// ========== ProviderRegistry ==========

void ProviderRegistry::register_adapter(std::shared_ptr<ProviderAdapter> adapter) {
    if (!adapter) {
        throw InvalidConfigException("Cannot register a null provider adapter");
    }
    std::unique_lock lock(mutex_);
    auto id = adapter->id();
    adapters_[id] = std::move(adapter);
}

bool ProviderRegistry::unregister_adapter(const ProviderId& id) {
    std::unique_lock lock(mutex_);
    return adapters_.erase(id) > 0;
}

std::shared_ptr<ProviderAdapter> ProviderRegistry::find(const ProviderId& id) const {
    std::shared_lock lock(mutex_);
    auto it = adapters_.find(id);
    if (it == adapters_.end()) return nullptr;
    return it->second;
}

std::shared_ptr<ProviderAdapter> ProviderRegistry::get(const ProviderId& id) const {
    auto adapter = find(id);
    if (!adapter) {
        throw ProviderNotFoundException(id);
    }
    return adapter;
}

std::vector<ProviderId> ProviderRegistry::providers() const {
    std::shared_lock lock(mutex_);
    std::vector<ProviderId> ids;
    ids.reserve(adapters_.size());
    for (auto& [id, _] : adapters_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace agentgate
