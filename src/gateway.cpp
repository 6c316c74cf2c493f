#include "agentgate/gateway.hpp"
#include "agentgate/exceptions.hpp"

#include <algorithm>
#include <random>
#include <set>
#include <thread>
#include <utility>

namespace agentgate {

namespace {

std::mt19937_64& thread_rng() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return rng;
}

bool is_rejection(ResponseStatus status) {
    switch (status) {
        case ResponseStatus::Unauthenticated:
        case ResponseStatus::Revoked:
        case ResponseStatus::Forbidden:
        case ResponseStatus::RateLimited:
        case ResponseStatus::BudgetExceeded:
        case ResponseStatus::InvalidRequest:
        case ResponseStatus::UnknownCapability:
        case ResponseStatus::NoProviderBinding:
            return true;
        default:
            return false;
    }
}

// Releases the reservation unless it was committed
class ReservationGuard {
public:
    ReservationGuard(BudgetLedger& ledger, ReservationId id)
        : ledger_(ledger), id_(id) {}

    ~ReservationGuard() {
        if (active_) {
            // Outcome is reported by the ledger's own events
            ledger_.release(id_);
        }
    }

    ReservationGuard(const ReservationGuard&) = delete;
    ReservationGuard& operator=(const ReservationGuard&) = delete;

    SettleResult commit(Money actual_cost) {
        active_ = false;
        return ledger_.commit(id_, actual_cost);
    }

    ReservationId id() const noexcept { return id_; }

private:
    BudgetLedger& ledger_;
    ReservationId id_;
    bool active_{true};
};

} // anonymous namespace

struct Gateway::RequestContext {
    RequestId request_id{0};
    AgentId agent_id;
    Capability capability;
    Timestamp started{};
    Money estimated_cost{0};
    TokenUsage usage;
    std::set<ProviderId> bound;
    std::vector<ProviderId> providers_attempted;
    ReservationGuard* reservation{nullptr};

    // Work must settle before the sweeper may reclaim the hold
    std::optional<Timestamp> settle_by;
};

Gateway::Gateway(Config config, GatewayComponents components)
    : config_(std::move(config))
    , components_(std::move(components))
    , estimator_(components_.pricing)
    , sleeper_([](Duration d) { std::this_thread::sleep_for(d); })
{
    validate_config(config_);
    if (!components_.validator || !components_.translator || !components_.ledger ||
        !components_.breakers || !components_.selector || !components_.rate_limiter ||
        !components_.providers || !components_.pricing) {
        throw InvalidConfigException("Gateway is missing a required component");
    }
}

Gateway::~Gateway() {
    if (pool_) {
        pool_->shutdown();
    }
    if (running_.load()) {
        stop();
    }
}

// ==================== Request Path ====================

InferenceResponse Gateway::handle(const InferenceRequest& request) {
    RequestContext ctx;
    ctx.request_id = next_request_id_.fetch_add(1);
    ctx.capability = request.capability;
    ctx.started = Clock::now();
    emit_event(EventType::RequestReceived, "Request for " + request.capability, ctx);

    InferenceResponse response;
    response.request_id = ctx.request_id;

    // 1. Authenticate
    auto validation = components_.validator->validate(request.bearer_token);
    if (!validation.ok()) {
        response.status = validation.status == ValidationStatus::Revoked
            ? ResponseStatus::Revoked : ResponseStatus::Unauthenticated;
        response.message = validation.reason;
        return finish(ctx, std::move(response));
    }
    const AgentIdentity& identity = *validation.identity;
    ctx.agent_id = identity.agent_id;
    emit_event(EventType::RequestAuthenticated, "Authenticated " + identity.name, ctx);

    if (!config_.tokens.required_scope.empty() && !identity.has_scope(config_.tokens.required_scope)) {
        response.status = ResponseStatus::Forbidden;
        response.message = "Missing scope " + config_.tokens.required_scope;
        return finish(ctx, std::move(response));
    }

    // 2. Rate limits: agent and endpoint class, charged together
    auto rate = components_.rate_limiter->check_request(ctx.agent_id, request.endpoint);
    if (!rate.allowed) {
        response.status = ResponseStatus::RateLimited;
        response.retry_after = rate.retry_after;
        response.message = "Rate limit exceeded";
        return finish(ctx, std::move(response));
    }

    if (request.payload.empty()) {
        response.status = ResponseStatus::InvalidRequest;
        response.message = "Empty payload";
        return finish(ctx, std::move(response));
    }

    // 3. Resolve the candidate tiers this agent may use
    auto tiers = components_.selector->tiers(request.capability);
    if (tiers.empty()) {
        response.status = ResponseStatus::UnknownCapability;
        response.message = "No fallback chain configured for " + request.capability;
        return finish(ctx, std::move(response));
    }

    for (auto& provider : components_.translator->bound_providers(ctx.agent_id)) {
        ctx.bound.insert(provider);
    }
    tiers.erase(std::remove_if(tiers.begin(), tiers.end(),
        [&ctx](const FallbackTier& tier) { return ctx.bound.count(tier.provider_id) == 0; }),
        tiers.end());
    if (tiers.empty()) {
        response.status = ResponseStatus::NoProviderBinding;
        response.message = "Agent is not bound to any provider serving " + request.capability;
        return finish(ctx, std::move(response));
    }

    // 4. Admission against the budget
    ctx.estimated_cost = estimator_.estimate(tiers, request.estimated_input_tokens,
                                             request.max_output_tokens);
    auto reserved = components_.ledger->reserve(ctx.agent_id, ctx.estimated_cost);
    switch (reserved.status) {
        case ReserveStatus::Reserved:
            break;
        case ReserveStatus::BudgetExceeded:
            response.status = ResponseStatus::BudgetExceeded;
            response.remaining_budget = reserved.remaining;
            response.message = "Estimated cost " + std::to_string(ctx.estimated_cost) +
                               " exceeds remaining budget";
            return finish(ctx, std::move(response));
        case ReserveStatus::UnknownAgent:
            response.status = ResponseStatus::Forbidden;
            response.message = "No budget account for agent";
            return finish(ctx, std::move(response));
        case ReserveStatus::InvalidAmount:
            response.status = ResponseStatus::InvalidRequest;
            response.message = "Invalid cost estimate";
            return finish(ctx, std::move(response));
    }

    // Keep a tenth of the hold's lifetime in hand for commit
    const auto& hold = *reserved.reservation;
    ctx.settle_by = hold.expires_at - (hold.expires_at - hold.created_at) / 10;

    InferenceResponse routed;
    {
        ReservationGuard guard(*components_.ledger, hold.id);
        ctx.reservation = &guard;
        routed = route(ctx, request);
        ctx.reservation = nullptr;
    }

    if (!routed.ok()) {
        // The guard has released the hold
        routed.remaining_budget = components_.ledger->remaining(ctx.agent_id).value_or(0);
    }
    routed.request_id = ctx.request_id;
    return finish(ctx, std::move(routed));
}

InferenceResponse Gateway::route(RequestContext& ctx, const InferenceRequest& request) {
    InferenceResponse response;
    // A provider may serve several tiers under different models
    std::set<std::pair<ProviderId, std::string>> tried;

    for (;;) {
        if (auto stopped = interrupted(ctx, request)) {
            response.status = *stopped;
            response.message = "Stopped before next candidate";
            return response;
        }

        auto candidates = components_.selector->select(ctx.capability);
        auto next = std::find_if(candidates.begin(), candidates.end(),
            [&ctx, &tried](const FallbackTier& tier) {
                return ctx.bound.count(tier.provider_id) > 0 &&
                       tried.count({tier.provider_id, tier.model}) == 0;
            });
        if (next == candidates.end()) {
            break;
        }
        const FallbackTier tier = *next;
        tried.emplace(tier.provider_id, tier.model);

        auto breaker = components_.breakers->get_or_create(tier.provider_id);
        auto permit = breaker->allow_request();
        if (!permit.allowed) {
            emit_event(EventType::ProviderShortCircuited, "Breaker refused call", ctx, tier.provider_id);
            continue;
        }

        auto adapter = components_.providers->find(tier.provider_id);
        if (!adapter) {
            if (permit.is_probe) breaker->cancel_probe();
            emit_event(EventType::FallbackAdvanced, "No adapter registered", ctx, tier.provider_id);
            continue;
        }

        auto translation = components_.translator->translate(ctx.agent_id, tier.provider_id);
        if (translation.status != TranslationStatus::Ok) {
            if (permit.is_probe) breaker->cancel_probe();
            if (translation.status == TranslationStatus::NoProviderBinding) {
                response.status = ResponseStatus::NoProviderBinding;
                response.message = translation.reason;
                return response;
            }
            if (config_.vault_failure_policy == VaultFailurePolicy::FailClosed) {
                response.status = ResponseStatus::VaultUnavailable;
                response.message = translation.reason;
                return response;
            }
            emit_event(EventType::FallbackAdvanced, "Credential unavailable; skipping", ctx, tier.provider_id);
            continue;
        }
        const ProviderCredential& credential = *translation.credential;
        ctx.providers_attempted.push_back(tier.provider_id);

        ProviderCall call;
        call.model = tier.model;
        call.payload = request.payload;
        auto price = components_.pricing->price_for(tier.model);
        call.max_output_tokens = request.max_output_tokens > 0
            ? std::min(request.max_output_tokens, price.max_output_tokens)
            : price.max_output_tokens;

        // A Half-Open probe gets exactly one try
        const std::uint32_t max_attempts = permit.is_probe ? 1 : config_.retry.max_attempts;
        for (std::uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
            if (auto stopped = interrupted(ctx, request)) {
                if (permit.is_probe) breaker->cancel_probe();
                response.status = *stopped;
                response.message = "Stopped before attempt";
                return response;
            }

            call.timeout = config_.attempt_timeout;
            if (auto deadline = effective_deadline(ctx, request)) {
                call.timeout = std::min(call.timeout, *deadline - Clock::now());
                if (call.timeout <= Duration::zero()) {
                    if (permit.is_probe) breaker->cancel_probe();
                    response.status = ResponseStatus::DeadlineExceeded;
                    response.message = "Stopped before attempt";
                    return response;
                }
            }

            auto result = adapter->invoke(call, credential);
            ++response.attempts;

            if (result.outcome == AttemptOutcome::Success) {
                breaker->record_success();
                auto actual = estimator_.actual(tier.model, result.usage);
                auto settled = ctx.reservation->commit(actual);
                ctx.usage = result.usage;

                response.status = ResponseStatus::Ok;
                response.body = std::move(result.body);
                response.provider_id = tier.provider_id;
                response.model = tier.model;
                response.actual_cost = actual;
                response.remaining_budget = settled.remaining;
                return response;
            }

            if (result.outcome == AttemptOutcome::Rejected) {
                // The provider answered; its health is not in question
                if (permit.is_probe) breaker->cancel_probe();
                response.status = ResponseStatus::InvalidRequest;
                response.body = std::move(result.body);
                response.provider_id = tier.provider_id;
                response.model = tier.model;
                response.message = result.error;
                return response;
            }

            emit_event(EventType::ProviderAttemptFailed,
                       "Attempt " + std::to_string(attempt) + ": " + result.error,
                       ctx, tier.provider_id);

            if (result.outcome == AttemptOutcome::CredentialRejected) {
                break;
            }

            if (attempt < max_attempts) {
                auto delay = config_.retry.delay_for(attempt, thread_rng());
                if (auto deadline = effective_deadline(ctx, request)) {
                    delay = std::max(Duration::zero(),
                                     std::min(delay, *deadline - Clock::now()));
                }
                if (delay > Duration::zero()) {
                    sleeper_(delay);
                }
            }
        }

        breaker->record_failure();
        emit_event(EventType::FallbackAdvanced, "Candidate exhausted", ctx, tier.provider_id);
    }

    response.status = ResponseStatus::AllProvidersUnavailable;
    response.message = "No provider could serve " + ctx.capability;
    return response;
}

std::future<InferenceResponse> Gateway::submit(InferenceRequest request) {
    std::call_once(pool_once_, [this] {
        pool_ = std::make_unique<WorkerPool>(config_.worker_threads, config_.io_headroom,
                                             config_.max_pending_requests);
    });
    return pool_->submit([this, request = std::move(request)] {
        return handle(request);
    });
}

// ==================== Lifecycle ====================

void Gateway::start() {
    if (running_.exchange(true)) {
        return;
    }
    components_.ledger->start();
    if (components_.audit) {
        components_.audit->start();
    }
}

void Gateway::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    components_.ledger->stop();
    if (components_.audit) {
        components_.audit->stop();
    }
}

bool Gateway::is_running() const noexcept {
    return running_.load();
}

void Gateway::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::atomic_store(&monitor_, monitor);
    components_.validator->set_monitor(monitor);
    components_.ledger->set_monitor(monitor);
    components_.breakers->set_monitor(monitor);
    components_.rate_limiter->set_monitor(monitor);
    if (components_.audit) {
        components_.audit->set_monitor(monitor);
    }
}

void Gateway::set_sleeper(Sleeper sleeper) {
    if (sleeper) {
        sleeper_ = std::move(sleeper);
    }
}

// ==================== Internal Helpers ====================

std::optional<Timestamp> Gateway::effective_deadline(const RequestContext& ctx,
                                                     const InferenceRequest& request) {
    if (request.deadline.has_value() && ctx.settle_by.has_value()) {
        return std::min(*request.deadline, *ctx.settle_by);
    }
    return request.deadline.has_value() ? request.deadline : ctx.settle_by;
}

std::optional<ResponseStatus> Gateway::interrupted(const RequestContext& ctx,
                                                   const InferenceRequest& request) const {
    if (request.cancel_flag && request.cancel_flag->load()) {
        return ResponseStatus::Cancelled;
    }
    auto deadline = effective_deadline(ctx, request);
    if (deadline.has_value() && Clock::now() >= *deadline) {
        return ResponseStatus::DeadlineExceeded;
    }
    return std::nullopt;
}

InferenceResponse Gateway::finish(RequestContext& ctx, InferenceResponse response) {
    auto elapsed_us = std::chrono::duration<double, std::micro>(Clock::now() - ctx.started).count();

    EventType type = EventType::RequestFailed;
    if (response.ok()) {
        type = EventType::RequestSucceeded;
    } else if (is_rejection(response.status)) {
        type = EventType::RequestRejected;
    }

    MonitorEvent event = make_event(type, response.message);
    event.request_id = ctx.request_id;
    if (!ctx.agent_id.empty()) event.agent_id = ctx.agent_id;
    if (!response.provider_id.empty()) event.provider_id = response.provider_id;
    if (response.ok()) event.amount = response.actual_cost;
    event.status = response.status;
    event.duration_us = elapsed_us;
    emit(std::atomic_load(&monitor_), std::move(event));

    publish_audit(ctx, response);
    return response;
}

void Gateway::publish_audit(const RequestContext& ctx, const InferenceResponse& response) {
    if (!components_.audit) return;

    AuditEvent audit;
    audit.kind = AuditEventKind::Audit;
    audit.request_id = ctx.request_id;
    audit.agent_id = ctx.agent_id;
    audit.capability = ctx.capability;
    audit.providers_attempted = ctx.providers_attempted;
    audit.provider_id = response.provider_id;
    audit.model = response.model;
    audit.status = response.status;
    audit.estimated_cost = ctx.estimated_cost;
    audit.actual_cost = response.actual_cost;
    audit.usage = ctx.usage;
    audit.attempts = response.attempts;
    audit.latency_ms = std::chrono::duration<double, std::milli>(Clock::now() - ctx.started).count();
    audit.timestamp = WallClock::now();

    if (response.ok()) {
        AuditEvent cost = audit;
        cost.kind = AuditEventKind::CostReport;
        components_.audit->enqueue(std::move(cost));
    }
    components_.audit->enqueue(std::move(audit));
}

void Gateway::emit_event(EventType type, const std::string& message, const RequestContext& ctx,
                         std::optional<ProviderId> provider_id) {
    auto monitor = std::atomic_load(&monitor_);
    if (!monitor) return;
    MonitorEvent event = make_event(type, message);
    event.request_id = ctx.request_id;
    if (!ctx.agent_id.empty()) event.agent_id = ctx.agent_id;
    event.provider_id = std::move(provider_id);
    emit(monitor, std::move(event));
}

} // namespace agentgate
