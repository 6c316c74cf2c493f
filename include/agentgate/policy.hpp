#pragma once

#include "agentgate/types.hpp"
#include "agentgate/pricing.hpp"

#include <memory>
#include <string>
#include <vector>

namespace agentgate {

// Abstract ordering policy for a capability's fallback candidates
class SelectionPolicy {
public:
    virtual ~SelectionPolicy() = default;

    // Given the eligible tiers, return them in the order they should be tried.
    virtual std::vector<FallbackTier> order(const std::vector<FallbackTier>& candidates) const = 0;

    virtual std::string name() const = 0;
};

// Highest preference weight first (default)
class PreferencePolicy : public SelectionPolicy {
public:
    std::vector<FallbackTier> order(const std::vector<FallbackTier>& candidates) const override;
    std::string name() const override { return "Preference"; }
};

// Cheapest model first, by combined input + output price
class CostAwarePolicy : public SelectionPolicy {
public:
    explicit CostAwarePolicy(std::shared_ptr<const PricingTable> pricing);

    std::vector<FallbackTier> order(const std::vector<FallbackTier>& candidates) const override;
    std::string name() const override { return "CostAware"; }

private:
    std::shared_ptr<const PricingTable> pricing_;
};

// Highest quality score first
class QualityAwarePolicy : public SelectionPolicy {
public:
    std::vector<FallbackTier> order(const std::vector<FallbackTier>& candidates) const override;
    std::string name() const override { return "QualityAware"; }
};

} // namespace agentgate
