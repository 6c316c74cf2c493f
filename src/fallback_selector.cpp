#include "agentgate/fallback_selector.hpp"
#include "agentgate/exceptions.hpp"

#include <algorithm>
#include <mutex>

namespace agentgate {

FallbackChainSelector::FallbackChainSelector(std::shared_ptr<CircuitBreakerRegistry> breakers,
                                             std::unique_ptr<SelectionPolicy> policy)
    : breakers_(std::move(breakers))
    , policy_(std::move(policy))
{
    if (!breakers_) {
        throw InvalidConfigException("FallbackChainSelector requires a breaker registry");
    }
    if (!policy_) {
        policy_ = std::make_unique<PreferencePolicy>();
    }
}

void FallbackChainSelector::add_tier(const Capability& capability, FallbackTier tier) {
    if (tier.provider_id.empty() || tier.model.empty()) {
        throw InvalidConfigException("Fallback tier for '" + capability +
                                     "' needs a provider and a model");
    }
    std::unique_lock lock(mutex_);
    chains_[capability].push_back(std::move(tier));
}

void FallbackChainSelector::set_tiers(const Capability& capability, std::vector<FallbackTier> tiers) {
    for (auto& tier : tiers) {
        if (tier.provider_id.empty() || tier.model.empty()) {
            throw InvalidConfigException("Fallback tier for '" + capability +
                                         "' needs a provider and a model");
        }
    }
    std::unique_lock lock(mutex_);
    chains_[capability] = std::move(tiers);
}

bool FallbackChainSelector::remove_capability(const Capability& capability) {
    std::unique_lock lock(mutex_);
    return chains_.erase(capability) > 0;
}

bool FallbackChainSelector::has_capability(const Capability& capability) const {
    std::shared_lock lock(mutex_);
    auto it = chains_.find(capability);
    return it != chains_.end() && !it->second.empty();
}

std::vector<FallbackTier> FallbackChainSelector::tiers(const Capability& capability) const {
    std::shared_lock lock(mutex_);
    auto it = chains_.find(capability);
    if (it == chains_.end()) return {};
    return it->second;
}

std::vector<Capability> FallbackChainSelector::capabilities() const {
    std::shared_lock lock(mutex_);
    std::vector<Capability> result;
    result.reserve(chains_.size());
    for (auto& [capability, _] : chains_) {
        result.push_back(capability);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<FallbackTier> FallbackChainSelector::select(const Capability& capability,
                                                        const std::set<ProviderId>& exclude) const {
    std::shared_lock lock(mutex_);
    auto it = chains_.find(capability);
    if (it == chains_.end()) return {};

    std::vector<FallbackTier> eligible;
    for (auto& tier : it->second) {
        if (exclude.count(tier.provider_id) > 0) continue;
        if (breakers_->state(tier.provider_id) == BreakerState::Open) continue;
        eligible.push_back(tier);
    }
    return policy_->order(eligible);
}

void FallbackChainSelector::set_policy(std::unique_ptr<SelectionPolicy> policy) {
    if (!policy) return;
    std::unique_lock lock(mutex_);
    policy_ = std::move(policy);
}

std::string FallbackChainSelector::policy_name() const {
    std::shared_lock lock(mutex_);
    return policy_->name();
}

} // namespace agentgate
