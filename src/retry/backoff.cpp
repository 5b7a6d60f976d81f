/**
 * VOXRELAY - Realtime Voice Gateway
 * Backoff Policy - Implementation
 */

#include "retry/backoff.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace voxrelay::retry {

BackoffPolicy::BackoffPolicy(const BackoffConfig& config)
    : config_(config)
{
    if (config_.max_attempts == 0) {
        config_.max_attempts = 1;
    }
}

std::chrono::milliseconds BackoffPolicy::delay(std::uint32_t attempt) const {
    if (attempt == 0) {
        throw std::invalid_argument("Backoff attempt numbers start at 1");
    }

    auto base = static_cast<double>(config_.min_wait.count());
    auto scaled = base * std::pow(config_.multiplier, static_cast<double>(attempt - 1));
    auto capped = std::min(scaled, static_cast<double>(config_.max_wait.count()));

    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(std::llround(capped)));
}

} // namespace voxrelay::retry
