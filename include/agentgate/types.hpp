#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentgate {

// Identifiers
using AgentId = std::string;
using ProviderId = std::string;
using Capability = std::string;
using ReservationId = std::uint64_t;
using RequestId = std::uint64_t;

// Money in integer micro-USD (1 USD = 1'000'000)
using Money = std::int64_t;

constexpr Money MICROS_PER_USD = 1'000'000;

inline Money usd_to_micros(double usd) {
    return static_cast<Money>(std::llround(usd * static_cast<double>(MICROS_PER_USD)));
}

inline double micros_to_usd(Money micros) {
    return static_cast<double>(micros) / static_cast<double>(MICROS_PER_USD);
}

// Time types
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;
using WallClock = std::chrono::system_clock;

// Outcome of a gateway request, returned to the calling agent
enum class ResponseStatus {
    Ok,
    Unauthenticated,
    Revoked,
    Forbidden,
    RateLimited,
    BudgetExceeded,
    UnknownCapability,
    NoProviderBinding,
    VaultUnavailable,
    InvalidRequest,
    AllProvidersUnavailable,
    Cancelled,
    DeadlineExceeded
};

enum class BreakerState {
    Closed,
    Open,
    HalfOpen
};

enum class ReservationState {
    Pending,
    Committed,
    Released,
    Expired
};

// Token usage reported by a provider
struct TokenUsage {
    std::uint64_t input_tokens{0};
    std::uint64_t output_tokens{0};
};

// One entry of a capability's fallback chain
struct FallbackTier {
    ProviderId provider_id;
    std::string model;
    double preference_weight{1.0};
    double quality_score{0.0};
};

// Resolved caller identity
struct AgentIdentity {
    AgentId agent_id;
    std::string name;
    std::vector<std::string> scopes;

    bool has_scope(const std::string& scope) const {
        for (auto& s : scopes) {
            if (s == scope) return true;
        }
        return false;
    }
};

inline const char* to_string(ResponseStatus s) {
    switch (s) {
        case ResponseStatus::Ok:                      return "Ok";
        case ResponseStatus::Unauthenticated:         return "Unauthenticated";
        case ResponseStatus::Revoked:                 return "Revoked";
        case ResponseStatus::Forbidden:               return "Forbidden";
        case ResponseStatus::RateLimited:             return "RateLimited";
        case ResponseStatus::BudgetExceeded:          return "BudgetExceeded";
        case ResponseStatus::UnknownCapability:       return "UnknownCapability";
        case ResponseStatus::NoProviderBinding:       return "NoProviderBinding";
        case ResponseStatus::VaultUnavailable:        return "VaultUnavailable";
        case ResponseStatus::InvalidRequest:          return "InvalidRequest";
        case ResponseStatus::AllProvidersUnavailable: return "AllProvidersUnavailable";
        case ResponseStatus::Cancelled:               return "Cancelled";
        case ResponseStatus::DeadlineExceeded:        return "DeadlineExceeded";
    }
    return "Unknown";
}

inline const char* to_string(BreakerState s) {
    switch (s) {
        case BreakerState::Closed:   return "Closed";
        case BreakerState::Open:     return "Open";
        case BreakerState::HalfOpen: return "HalfOpen";
    }
    return "Unknown";
}

inline const char* to_string(ReservationState s) {
    switch (s) {
        case ReservationState::Pending:   return "Pending";
        case ReservationState::Committed: return "Committed";
        case ReservationState::Released:  return "Released";
        case ReservationState::Expired:   return "Expired";
    }
    return "Unknown";
}

} // namespace agentgate
