#include "agentgate/pricing.hpp"
#include "agentgate/exceptions.hpp"

#include <algorithm>
#include <mutex>

namespace agentgate {

namespace {

constexpr Money TOKENS_PER_PRICE_UNIT = 1'000'000;

Money per_million(std::uint64_t tokens, Money price_per_million) {
    // Ceil division keeps sub-micro charges from rounding to zero
    auto scaled = static_cast<Money>(tokens) * price_per_million;
    return (scaled + TOKENS_PER_PRICE_UNIT - 1) / TOKENS_PER_PRICE_UNIT;
}

void check_price(const ModelPrice& price) {
    if (price.input_per_million < 0 || price.output_per_million < 0) {
        throw InvalidConfigException("Model prices must be non-negative");
    }
}

} // anonymous namespace

// ========== PricingTable ==========

PricingTable::PricingTable(ModelPrice default_price)
    : default_price_(default_price)
{
    check_price(default_price_);
}

void PricingTable::set_price(const std::string& model, ModelPrice price) {
    check_price(price);
    std::unique_lock lock(mutex_);
    prices_[model] = price;
}

bool PricingTable::remove_price(const std::string& model) {
    std::unique_lock lock(mutex_);
    return prices_.erase(model) > 0;
}

std::optional<ModelPrice> PricingTable::find(const std::string& model) const {
    std::shared_lock lock(mutex_);
    auto it = prices_.find(model);
    if (it == prices_.end()) return std::nullopt;
    return it->second;
}

ModelPrice PricingTable::price_for(const std::string& model) const {
    return find(model).value_or(default_price_);
}

Money PricingTable::cost(const std::string& model, const TokenUsage& usage) const {
    auto price = price_for(model);
    return per_million(usage.input_tokens, price.input_per_million) +
           per_million(usage.output_tokens, price.output_per_million);
}

Money PricingTable::max_cost(const std::string& model,
                             std::uint64_t input_tokens,
                             std::uint64_t requested_max_output) const {
    auto price = price_for(model);
    std::uint64_t output_tokens = price.max_output_tokens;
    if (requested_max_output > 0) {
        output_tokens = std::min<std::uint64_t>(requested_max_output, price.max_output_tokens);
    }
    return per_million(input_tokens, price.input_per_million) +
           per_million(output_tokens, price.output_per_million);
}

// ========== CostEstimator ==========

CostEstimator::CostEstimator(std::shared_ptr<const PricingTable> pricing)
    : pricing_(std::move(pricing))
{
    if (!pricing_) {
        throw InvalidConfigException("CostEstimator requires a pricing table");
    }
}

Money CostEstimator::estimate(const std::vector<FallbackTier>& tiers,
                              std::uint64_t input_tokens,
                              std::uint64_t requested_max_output) const {
    Money worst = 0;
    for (auto& tier : tiers) {
        worst = std::max(worst, pricing_->max_cost(tier.model, input_tokens, requested_max_output));
    }
    return worst;
}

Money CostEstimator::actual(const std::string& model, const TokenUsage& usage) const {
    return pricing_->cost(model, usage);
}

} // namespace agentgate
