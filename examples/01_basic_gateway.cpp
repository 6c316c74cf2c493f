// 01_basic_gateway.cpp
//
// A single agent calls the "chat" capability through the gateway.
// The agent holds only its gateway token; the OpenAI key lives sealed in
// the credential vault and is attached to the outbound call by the gateway.
//
// The transport is simulated so the example runs offline. Set
// AGENTGATE_EXAMPLE_OPENAI_URL to an OpenAI-compatible server (for example
// http://127.0.0.1:8080) to send the call over HTTP instead.

#include <agentgate/agentgate.hpp>

#include <cstdlib>
#include <iomanip>
#include <iostream>

using namespace agentgate;
using namespace std::chrono_literals;

// Answers every call like the Chat Completions API would
class SimulatedOpenAi : public HttpTransport {
public:
    HttpResponse send(const HttpRequest& request) override {
        std::cout << "  -> " << request.method << " " << request.url << "\n";
        HttpResponse response;
        response.status = 200;
        response.body =
            R"({"id":"chatcmpl-1","choices":[{"message":{"role":"assistant",)"
            R"("content":"Hello from the simulated provider."}}],)"
            R"("usage":{"prompt_tokens":120,"completion_tokens":48}})";
        return response;
    }
};

int main() {
    std::cout << "=== AgentGate: Basic Gateway Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Configuration
    // ----------------------------------------------------------------
    Config config = load_config_from_env();
    if (config.tokens.signing_secret.empty()) {
        config.tokens.signing_secret = "example-signing-secret";
    }

    auto console = std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose);

    // ----------------------------------------------------------------
    // 2. Secrets: vault + bindings
    // ----------------------------------------------------------------
    auto vault = std::make_shared<CredentialVault>(
        crypto::SecretCipher(crypto::random_bytes(crypto::KEY_SIZE)));
    vault->register_credential("openai", "sk-proj-example-0000000000000000");

    auto translator = std::make_shared<TokenTranslator>(vault);
    translator->bind("research-agent", "openai");

    auto validator = std::make_shared<TokenValidator>(config.tokens);
    std::string token = validator->mint("research-agent", "Research Agent", {"llm:call"});
    std::cout << "Minted token for research-agent (" << token.size() << " chars)\n\n";

    // ----------------------------------------------------------------
    // 3. Budget, pricing, providers
    // ----------------------------------------------------------------
    auto ledger = std::make_shared<BudgetLedger>(config.ledger);
    ledger->open_account("research-agent", usd_to_micros(5.00));

    auto pricing = std::make_shared<PricingTable>(config.default_price);
    pricing->set_price("gpt-4o-mini", ModelPrice{150'000, 600'000, 4096});

    auto breakers = std::make_shared<CircuitBreakerRegistry>(config.breaker);
    auto selector = std::make_shared<FallbackChainSelector>(breakers);
    selector->add_tier("chat", FallbackTier{"openai", "gpt-4o-mini", 1.0, 0.7});

    auto providers = std::make_shared<ProviderRegistry>();
    if (const char* url = std::getenv("AGENTGATE_EXAMPLE_OPENAI_URL")) {
        providers->register_adapter(
            std::make_shared<OpenAiAdapter>("openai", std::make_shared<HttplibTransport>(), url));
    } else {
        providers->register_adapter(
            std::make_shared<OpenAiAdapter>("openai", std::make_shared<SimulatedOpenAi>()));
    }

    auto audit = std::make_shared<AuditDispatcher>(
        std::make_shared<StreamAuditSink>(std::cout), config.audit);

    GatewayComponents components;
    components.validator = validator;
    components.translator = translator;
    components.ledger = ledger;
    components.breakers = breakers;
    components.selector = selector;
    components.rate_limiter = std::make_shared<RateLimiter>(config.rate_limit);
    components.providers = providers;
    components.pricing = pricing;
    components.audit = audit;

    Gateway gateway(config, components);
    gateway.set_monitor(console);
    gateway.start();

    // ----------------------------------------------------------------
    // 4. One request
    // ----------------------------------------------------------------
    InferenceRequest request;
    request.bearer_token = token;
    request.capability = "chat";
    request.payload = R"([{"role":"user","content":"Summarise the quarterly report."}])";
    request.estimated_input_tokens = 200;
    request.max_output_tokens = 256;
    request.deadline = Clock::now() + 10s;

    auto response = gateway.handle(request);

    std::cout << "\nStatus:   " << to_string(response.status) << "\n";
    std::cout << "Provider: " << response.provider_id << " / " << response.model << "\n";
    std::cout << std::fixed << std::setprecision(6);
    std::cout << "Charged:  $" << micros_to_usd(response.actual_cost) << "\n";
    std::cout << "Left:     $" << micros_to_usd(response.remaining_budget) << "\n";
    std::cout << "Body:     " << response.body << "\n\n";

    // ----------------------------------------------------------------
    // 5. Revocation takes effect on the next request
    // ----------------------------------------------------------------
    validator->revoke(token);
    auto denied = gateway.handle(request);
    std::cout << "After revoke: " << to_string(denied.status) << "\n\n";

    gateway.stop();

    std::cout << "=== Done ===\n";
    return 0;
}
