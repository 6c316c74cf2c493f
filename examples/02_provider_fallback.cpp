// 02_provider_fallback.cpp
//
// The "chat" capability is served by OpenAI first and Anthropic second.
// OpenAI starts returning 503s; after five failures its circuit breaker
// opens and the gateway goes straight to Anthropic without touching the
// failing provider. Once the cooldown elapses a single probe is let
// through and, if it succeeds, OpenAI is back in rotation.

#include <agentgate/agentgate.hpp>

#include <atomic>
#include <iostream>
#include <thread>

using namespace agentgate;
using namespace std::chrono_literals;

class FlakyOpenAi : public HttpTransport {
public:
    std::atomic<bool> healthy{false};
    std::atomic<int> calls{0};

    HttpResponse send(const HttpRequest&) override {
        calls++;
        HttpResponse response;
        if (!healthy) {
            response.status = 503;
            response.body = R"({"error":{"message":"overloaded"}})";
            return response;
        }
        response.status = 200;
        response.body = R"({"choices":[],"usage":{"prompt_tokens":50,"completion_tokens":20}})";
        return response;
    }
};

class SteadyAnthropic : public HttpTransport {
public:
    std::atomic<int> calls{0};

    HttpResponse send(const HttpRequest&) override {
        calls++;
        HttpResponse response;
        response.status = 200;
        response.body = R"({"content":[],"usage":{"input_tokens":50,"output_tokens":20}})";
        return response;
    }
};

int main() {
    std::cout << "=== AgentGate: Provider Fallback Example ===\n\n";

    Config config;
    config.tokens.signing_secret = "example-signing-secret";
    config.retry.max_attempts = 1;
    config.breaker.failure_threshold = 5;
    config.breaker.cooldown = 300ms;

    auto metrics = std::make_shared<MetricsMonitor>();
    metrics->set_breaker_open_alert([](const std::string& msg) {
        std::cout << "  [ALERT] " << msg << "\n";
    });

    auto vault = std::make_shared<CredentialVault>(
        crypto::SecretCipher(crypto::random_bytes(crypto::KEY_SIZE)));
    vault->register_credential("openai", "sk-proj-example-0000000000000000");
    vault->register_credential("anthropic", "sk-ant-REDACTED");

    auto translator = std::make_shared<TokenTranslator>(vault);
    translator->bind("planner", "openai");
    translator->bind("planner", "anthropic");

    auto validator = std::make_shared<TokenValidator>(config.tokens);
    std::string token = validator->mint("planner", "Planner", {"llm:call"});

    auto ledger = std::make_shared<BudgetLedger>(config.ledger);
    ledger->open_account("planner", usd_to_micros(50.0));

    auto pricing = std::make_shared<PricingTable>();
    pricing->set_price("gpt-4o", ModelPrice{2'500'000, 10'000'000, 4096});
    pricing->set_price("claude-sonnet", ModelPrice{3'000'000, 15'000'000, 4096});

    auto breakers = std::make_shared<CircuitBreakerRegistry>(config.breaker);
    auto selector = std::make_shared<FallbackChainSelector>(breakers);
    selector->add_tier("chat", FallbackTier{"openai", "gpt-4o", 2.0, 0.8});
    selector->add_tier("chat", FallbackTier{"anthropic", "claude-sonnet", 1.0, 0.8});

    auto openai = std::make_shared<FlakyOpenAi>();
    auto anthropic = std::make_shared<SteadyAnthropic>();
    auto providers = std::make_shared<ProviderRegistry>();
    providers->register_adapter(std::make_shared<OpenAiAdapter>("openai", openai));
    providers->register_adapter(std::make_shared<AnthropicAdapter>("anthropic", anthropic));

    GatewayComponents components;
    components.validator = validator;
    components.translator = translator;
    components.ledger = ledger;
    components.breakers = breakers;
    components.selector = selector;
    components.rate_limiter = std::make_shared<RateLimiter>(config.rate_limit);
    components.providers = providers;
    components.pricing = pricing;

    Gateway gateway(config, components);
    gateway.set_monitor(metrics);

    InferenceRequest request;
    request.bearer_token = token;
    request.capability = "chat";
    request.payload = R"([{"role":"user","content":"Plan the next step."}])";
    request.estimated_input_tokens = 100;
    request.max_output_tokens = 100;

    auto run = [&](int n) {
        for (int i = 0; i < n; ++i) {
            auto r = gateway.handle(request);
            std::cout << "  request " << r.request_id << ": " << to_string(r.status)
                      << " via " << r.provider_id
                      << " (openai breaker " << to_string(breakers->state("openai")) << ")\n";
        }
    };

    std::cout << "Phase 1: OpenAI is failing\n";
    run(7);
    std::cout << "  OpenAI calls: " << openai->calls << ", Anthropic calls: "
              << anthropic->calls << "\n\n";

    std::cout << "Phase 2: OpenAI recovers, wait for cooldown\n";
    openai->healthy = true;
    std::this_thread::sleep_for(350ms);
    run(3);
    std::cout << "  OpenAI calls: " << openai->calls << ", Anthropic calls: "
              << anthropic->calls << "\n\n";

    auto m = metrics->get_metrics();
    std::cout << "Requests:          " << m.total_requests << "\n";
    std::cout << "Succeeded:         " << m.succeeded_requests << "\n";
    std::cout << "Fallback advances: " << m.fallback_advances << "\n";
    std::cout << "Breaker opens:     " << m.breaker_opens << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
