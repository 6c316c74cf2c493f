#pragma once

#include "agentgate/types.hpp"
#include "agentgate/circuit_breaker.hpp"
#include "agentgate/policy.hpp"

#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentgate {

// Ordered candidate list per capability, filtered by breaker state
class FallbackChainSelector {
public:
    explicit FallbackChainSelector(std::shared_ptr<CircuitBreakerRegistry> breakers,
                                   std::unique_ptr<SelectionPolicy> policy = std::make_unique<PreferencePolicy>());

    FallbackChainSelector(const FallbackChainSelector&) = delete;
    FallbackChainSelector& operator=(const FallbackChainSelector&) = delete;

    // ==================== Tier Configuration ====================

    void add_tier(const Capability& capability, FallbackTier tier);
    void set_tiers(const Capability& capability, std::vector<FallbackTier> tiers);
    bool remove_capability(const Capability& capability);

    bool has_capability(const Capability& capability) const;
    std::vector<FallbackTier> tiers(const Capability& capability) const;
    std::vector<Capability> capabilities() const;

    // ==================== Selection ====================

    // Tiers whose provider breaker is not Open and that are not excluded,
    // in policy order. Empty means nothing can serve the capability now.
    std::vector<FallbackTier> select(const Capability& capability,
                                     const std::set<ProviderId>& exclude = {}) const;

    void set_policy(std::unique_ptr<SelectionPolicy> policy);
    std::string policy_name() const;

private:
    std::shared_ptr<CircuitBreakerRegistry> breakers_;

    mutable std::shared_mutex mutex_;
    std::unique_ptr<SelectionPolicy> policy_;
    std::unordered_map<Capability, std::vector<FallbackTier>> chains_;
};

} // namespace agentgate
