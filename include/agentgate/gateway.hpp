#pragma once

#include "agentgate/types.hpp"
#include "agentgate/config.hpp"
#include "agentgate/monitor.hpp"
#include "agentgate/token_validator.hpp"
#include "agentgate/token_translator.hpp"
#include "agentgate/budget_ledger.hpp"
#include "agentgate/circuit_breaker.hpp"
#include "agentgate/fallback_selector.hpp"
#include "agentgate/rate_limiter.hpp"
#include "agentgate/provider.hpp"
#include "agentgate/pricing.hpp"
#include "agentgate/audit.hpp"
#include "agentgate/worker_pool.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace agentgate {

struct InferenceRequest {
    std::string bearer_token;
    Capability capability;
    std::string payload;

    std::uint64_t estimated_input_tokens{0};
    // 0 = the serving model's maximum
    std::uint32_t max_output_tokens{0};

    // Endpoint class used for the endpoint rate-limit key
    std::string endpoint = "chat";

    std::optional<Timestamp> deadline;
    std::shared_ptr<std::atomic<bool>> cancel_flag;
};

struct InferenceResponse {
    ResponseStatus status{ResponseStatus::Ok};
    RequestId request_id{0};
    std::string body;
    ProviderId provider_id;
    std::string model;
    Money actual_cost{0};
    Money remaining_budget{0};
    Duration retry_after{Duration::zero()};
    std::uint32_t attempts{0};
    std::string message;

    bool ok() const noexcept { return status == ResponseStatus::Ok; }
};

// Shared collaborators. All but audit are required.
struct GatewayComponents {
    std::shared_ptr<TokenValidator> validator;
    std::shared_ptr<TokenTranslator> translator;
    std::shared_ptr<BudgetLedger> ledger;
    std::shared_ptr<CircuitBreakerRegistry> breakers;
    std::shared_ptr<FallbackChainSelector> selector;
    std::shared_ptr<RateLimiter> rate_limiter;
    std::shared_ptr<ProviderRegistry> providers;
    std::shared_ptr<PricingTable> pricing;
    std::shared_ptr<AuditDispatcher> audit;
};

// Drives one inference request from bearer token to settled cost.
//
// validate -> scope -> rate limit -> estimate -> reserve -> candidates ->
// breaker permit -> credential -> attempts with backoff -> commit or release.
// Expected outcomes are reported through InferenceResponse::status; the
// reservation is released on every path that does not commit.
class Gateway {
public:
    using Sleeper = std::function<void(Duration)>;

    Gateway(Config config, GatewayComponents components);
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    InferenceResponse handle(const InferenceRequest& request);

    // Runs handle() on the worker pool. Throws QueueFullException when the
    // pending queue is at max_pending_requests.
    std::future<InferenceResponse> submit(InferenceRequest request);

    // Starts the ledger sweeper and the audit drain thread
    void start();
    void stop();
    bool is_running() const noexcept;

    // Attaches the monitor here and to every component that reports events
    void set_monitor(std::shared_ptr<Monitor> monitor);

    // Replaces the backoff sleep (tests use a recording no-op)
    void set_sleeper(Sleeper sleeper);

    const Config& config() const noexcept { return config_; }
    const GatewayComponents& components() const noexcept { return components_; }

private:
    struct RequestContext;

    Config config_;
    GatewayComponents components_;
    CostEstimator estimator_;
    std::shared_ptr<Monitor> monitor_;
    Sleeper sleeper_;

    std::atomic<RequestId> next_request_id_{1};
    std::atomic<bool> running_{false};

    std::once_flag pool_once_;
    std::unique_ptr<WorkerPool> pool_;

    InferenceResponse route(RequestContext& ctx, const InferenceRequest& request);
    // Earlier of the caller's deadline and the reservation's settle point
    static std::optional<Timestamp> effective_deadline(const RequestContext& ctx,
                                                       const InferenceRequest& request);
    std::optional<ResponseStatus> interrupted(const RequestContext& ctx,
                                              const InferenceRequest& request) const;
    InferenceResponse finish(RequestContext& ctx, InferenceResponse response);
    void publish_audit(const RequestContext& ctx, const InferenceResponse& response);
    void emit_event(EventType type, const std::string& message, const RequestContext& ctx,
                    std::optional<ProviderId> provider_id = std::nullopt);
};

} // namespace agentgate
