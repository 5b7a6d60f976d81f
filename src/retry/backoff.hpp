/**
 * VOXRELAY - Realtime Voice Gateway
 * Backoff Policy - Exponential retry delays for transient backend failures
 *
 * delay(n) = min(max_wait, min_wait * multiplier^(n-1)), n starting at 1.
 * Only TransientBackendError is retried; every other failure propagates on
 * the first attempt. After max_attempts the last error is rethrown.
 */

#ifndef VOXRELAY_RETRY_BACKOFF_HPP
#define VOXRELAY_RETRY_BACKOFF_HPP

#include "pipeline/errors.hpp"
#include "util/clock.hpp"
#include "util/logger.hpp"

#include <chrono>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace voxrelay::retry {

struct BackoffConfig {
    std::chrono::milliseconds min_wait{1000};
    double multiplier{2.0};
    std::chrono::milliseconds max_wait{10000};
    std::uint32_t max_attempts{3};
};

class BackoffPolicy {
public:
    explicit BackoffPolicy(const BackoffConfig& config = {});

    /**
     * Delay to wait after the given failed attempt
     *
     * @param attempt 1-indexed attempt number
     * @throws std::invalid_argument if attempt is 0
     */
    std::chrono::milliseconds delay(std::uint32_t attempt) const;

    std::uint32_t max_attempts() const noexcept { return config_.max_attempts; }

    const BackoffConfig& config() const noexcept { return config_; }

    /**
     * Run a callable, retrying transient backend failures
     *
     * @param callable Operation to attempt
     * @param sleeper Used to wait between attempts
     * @param operation Name used in log messages
     */
    template <typename Callable>
    auto run(Callable&& callable, util::Sleeper& sleeper,
             std::string_view operation = "backend call") const
        -> std::invoke_result_t<Callable&>
    {
        for (std::uint32_t attempt = 1;; ++attempt) {
            try {
                return callable();
            } catch (const pipeline::TransientBackendError& e) {
                if (attempt >= config_.max_attempts) {
                    VOXRELAY_LOG_WARN(util::log_component::Retry,
                                      "{}: giving up after {} attempts: {}",
                                      operation, attempt, e.what());
                    throw;
                }

                auto wait = delay(attempt);
                VOXRELAY_LOG_INFO(util::log_component::Retry,
                                  "{}: attempt {}/{} failed ({}), retrying in {}ms",
                                  operation, attempt, config_.max_attempts, e.what(), wait.count());
                sleeper.sleep_for(wait);
            }
        }
    }

private:
    BackoffConfig config_;
};

} // namespace voxrelay::retry

#endif // VOXRELAY_RETRY_BACKOFF_HPP
