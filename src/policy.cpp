#include "agentgate/policy.hpp"
#include "agentgate/exceptions.hpp"

#include <algorithm>

namespace agentgate {

// ========== PreferencePolicy ==========

std::vector<FallbackTier> PreferencePolicy::order(const std::vector<FallbackTier>& candidates) const {
    auto result = candidates;
    std::stable_sort(result.begin(), result.end(),
        [](const FallbackTier& a, const FallbackTier& b) {
            return a.preference_weight > b.preference_weight;
        });
    return result;
}

// ========== CostAwarePolicy ==========

CostAwarePolicy::CostAwarePolicy(std::shared_ptr<const PricingTable> pricing)
    : pricing_(std::move(pricing))
{
    if (!pricing_) {
        throw InvalidConfigException("CostAwarePolicy requires a pricing table");
    }
}

std::vector<FallbackTier> CostAwarePolicy::order(const std::vector<FallbackTier>& candidates) const {
    auto result = candidates;
    auto blended = [this](const FallbackTier& tier) {
        auto price = pricing_->price_for(tier.model);
        return price.input_per_million + price.output_per_million;
    };
    std::stable_sort(result.begin(), result.end(),
        [&blended](const FallbackTier& a, const FallbackTier& b) {
            auto a_cost = blended(a);
            auto b_cost = blended(b);
            if (a_cost != b_cost) return a_cost < b_cost;
            return a.preference_weight > b.preference_weight;
        });
    return result;
}

// ========== QualityAwarePolicy ==========

std::vector<FallbackTier> QualityAwarePolicy::order(const std::vector<FallbackTier>& candidates) const {
    auto result = candidates;
    std::stable_sort(result.begin(), result.end(),
        [](const FallbackTier& a, const FallbackTier& b) {
            if (a.quality_score != b.quality_score) return a.quality_score > b.quality_score;
            return a.preference_weight > b.preference_weight;
        });
    return result;
}

} // namespace agentgate
