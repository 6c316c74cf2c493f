#pragma once

#include "agentgate/types.hpp"
#include "agentgate/config.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentgate {

// Model -> price per million tokens, in micro-USD
class PricingTable {
public:
    explicit PricingTable(ModelPrice default_price = ModelPrice{});

    void set_price(const std::string& model, ModelPrice price);
    bool remove_price(const std::string& model);
    std::optional<ModelPrice> find(const std::string& model) const;

    // Falls back to the default price for unknown models
    ModelPrice price_for(const std::string& model) const;

    // Cost of reported usage; fractional micro-USD round up
    Money cost(const std::string& model, const TokenUsage& usage) const;

    // Worst-case cost: input plus min(requested, model max) output tokens.
    // requested_max_output == 0 means the model's own maximum.
    Money max_cost(const std::string& model,
                   std::uint64_t input_tokens,
                   std::uint64_t requested_max_output) const;

private:
    ModelPrice default_price_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, ModelPrice> prices_;
};

// Admission-time estimate for a request. Any tier may end up serving the
// request, so the reservation covers the most expensive one.
class CostEstimator {
public:
    explicit CostEstimator(std::shared_ptr<const PricingTable> pricing);

    Money estimate(const std::vector<FallbackTier>& tiers,
                   std::uint64_t input_tokens,
                   std::uint64_t requested_max_output) const;

    Money actual(const std::string& model, const TokenUsage& usage) const;

private:
    std::shared_ptr<const PricingTable> pricing_;
};

} // namespace agentgate
