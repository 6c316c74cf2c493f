// 03_budget_contention.cpp
//
// Eight requests from one agent arrive at once against a $10 budget.
// Each is estimated at $4 worst case, so only two can hold a reservation
// at the same time. The rest are refused up front with BudgetExceeded
// instead of being sent and overspending.

#include <agentgate/agentgate.hpp>

#include <iomanip>
#include <iostream>
#include <thread>
#include <vector>

using namespace agentgate;
using namespace std::chrono_literals;

// Slow provider so the reservations overlap
class SlowProvider : public HttpTransport {
public:
    HttpResponse send(const HttpRequest&) override {
        std::this_thread::sleep_for(100ms);
        HttpResponse response;
        response.status = 200;
        response.body = R"({"choices":[],"usage":{"prompt_tokens":1000,"completion_tokens":100000}})";
        return response;
    }
};

int main() {
    std::cout << "=== AgentGate: Budget Contention Example ===\n\n";

    Config config;
    config.tokens.signing_secret = "example-signing-secret";
    config.worker_threads = 8;
    config.rate_limit.enabled = false;

    auto console = std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal);

    auto vault = std::make_shared<CredentialVault>(
        crypto::SecretCipher(crypto::random_bytes(crypto::KEY_SIZE)));
    vault->register_credential("openai", "sk-proj-example-0000000000000000");
    auto translator = std::make_shared<TokenTranslator>(vault);
    translator->bind("batch-agent", "openai");

    auto validator = std::make_shared<TokenValidator>(config.tokens);
    std::string token = validator->mint("batch-agent", "Batch Agent", {"llm:call"});

    auto ledger = std::make_shared<BudgetLedger>(config.ledger);
    ledger->open_account("batch-agent", usd_to_micros(10.0));

    // $40 per million output tokens, 100k max output: $4.00 worst case
    auto pricing = std::make_shared<PricingTable>();
    pricing->set_price("gpt-big", ModelPrice{0, 40'000'000, 100'000});

    auto breakers = std::make_shared<CircuitBreakerRegistry>(config.breaker);
    auto selector = std::make_shared<FallbackChainSelector>(breakers);
    selector->add_tier("chat", FallbackTier{"openai", "gpt-big"});

    auto providers = std::make_shared<ProviderRegistry>();
    providers->register_adapter(
        std::make_shared<OpenAiAdapter>("openai", std::make_shared<SlowProvider>()));

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
    gateway.set_monitor(console);

    InferenceRequest request;
    request.bearer_token = token;
    request.capability = "chat";
    request.payload = R"([{"role":"user","content":"Write the long report."}])";

    std::vector<std::future<InferenceResponse>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(gateway.submit(request));
    }

    std::cout << std::fixed << std::setprecision(2);
    for (auto& f : futures) {
        auto r = f.get();
        std::cout << "  request " << r.request_id << ": " << to_string(r.status);
        if (r.ok()) {
            std::cout << " charged $" << micros_to_usd(r.actual_cost);
        }
        std::cout << " remaining $" << micros_to_usd(r.remaining_budget) << "\n";
    }

    auto snap = ledger->snapshot("batch-agent");
    if (snap) {
        std::cout << "\nLimit $" << micros_to_usd(snap->limit)
                  << ", spent $" << micros_to_usd(snap->spent)
                  << ", pending $" << micros_to_usd(snap->pending) << "\n";
    }

    gateway.stop();
    std::cout << "\n=== Done ===\n";
    return 0;
}
