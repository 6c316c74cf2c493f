#include "agentgate/retry_policy.hpp"

#include <algorithm>
#include <stdexcept>

namespace agentgate {

Duration RetryPolicy::nominal_delay(std::uint32_t failed_attempt) const {
    if (failed_attempt == 0) return Duration::zero();

    double base = static_cast<double>(base_delay.count());
    double cap = static_cast<double>(max_delay.count());
    double delay = base;
    for (std::uint32_t i = 1; i < failed_attempt && delay < cap; ++i) {
        delay *= multiplier;
    }
    delay = std::min(delay, cap);
    return Duration(static_cast<Duration::rep>(delay));
}

Duration RetryPolicy::delay_for(std::uint32_t failed_attempt, std::mt19937_64& rng) const {
    auto nominal = nominal_delay(failed_attempt);
    if (nominal <= Duration::zero()) return Duration::zero();

    std::uniform_real_distribution<double> jitter(jitter_min, jitter_max);
    double factor = (jitter_max > jitter_min) ? jitter(rng) : jitter_max;
    return Duration(static_cast<Duration::rep>(
        static_cast<double>(nominal.count()) * factor));
}

void RetryPolicy::validate() const {
    if (max_attempts == 0) {
        throw std::invalid_argument("RetryPolicy max_attempts must be at least 1");
    }
    if (multiplier < 1.0) {
        throw std::invalid_argument("RetryPolicy multiplier must be >= 1.0");
    }
    if (base_delay < Duration::zero() || max_delay < base_delay) {
        throw std::invalid_argument("RetryPolicy delays must satisfy 0 <= base_delay <= max_delay");
    }
    if (jitter_min < 0.0 || jitter_max < jitter_min) {
        throw std::invalid_argument("RetryPolicy jitter bounds must satisfy 0 <= min <= max");
    }
}

} // namespace agentgate
