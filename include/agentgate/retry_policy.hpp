#pragma once

#include "agentgate/types.hpp"

#include <cstdint>
#include <random>

namespace agentgate {

// Bounded exponential backoff with jitter, consumed by a plain retry loop.
//
// delay(n) = min(base_delay * multiplier^(n-1), max_delay) * U[jitter_min, jitter_max]
// where n is the 1-based number of the attempt that just failed.
struct RetryPolicy {
    std::uint32_t max_attempts = 3;
    Duration base_delay = std::chrono::milliseconds(100);
    double multiplier = 2.0;
    Duration max_delay = std::chrono::seconds(5);
    double jitter_min = 0.5;
    double jitter_max = 1.0;

    bool should_retry(std::uint32_t attempts_made) const noexcept {
        return attempts_made < max_attempts;
    }

    // Upper bound before jitter is applied
    Duration nominal_delay(std::uint32_t failed_attempt) const;

    Duration delay_for(std::uint32_t failed_attempt, std::mt19937_64& rng) const;

    // Throws std::invalid_argument on inconsistent settings
    void validate() const;
};

} // namespace agentgate
