/**
 * VOXRELAY - Realtime Voice Gateway
 * Circuit Breaker - Isolates a failing backend
 *
 * States:
 * - closed: calls pass through; consecutive failures are counted
 * - open: calls are rejected immediately with BreakerOpenError
 * - half_open: a bounded number of probe calls test whether the backend recovered
 *
 * The open -> half_open transition is evaluated lazily when a call arrives,
 * never by a timer. All state reads and writes happen under one mutex.
 */

#ifndef VOXRELAY_BREAKER_CIRCUIT_BREAKER_HPP
#define VOXRELAY_BREAKER_CIRCUIT_BREAKER_HPP

#include "pipeline/errors.hpp"
#include "util/clock.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace voxrelay::breaker {

enum class BreakerState {
    closed,
    open,
    half_open
};

inline std::string_view to_string(BreakerState state) {
    switch (state) {
        case BreakerState::closed: return "closed";
        case BreakerState::open: return "open";
        case BreakerState::half_open: return "half_open";
        default: return "unknown";
    }
}

struct CircuitBreakerConfig {
    std::uint32_t failure_threshold{5};             // Failures before opening
    std::chrono::seconds recovery_timeout{60};      // Time open before probing
    std::uint32_t success_threshold{2};             // Probe successes before closing
    std::uint32_t half_open_max_calls{1};           // Concurrent probes while half-open
    std::string name{"synthesis"};                  // Used in logs and errors
};

/**
 * Observable breaker status
 */
struct BreakerStatus {
    std::string name;
    BreakerState state{BreakerState::closed};
    std::uint32_t failure_count{0};
    std::uint32_t success_count{0};
    std::uint64_t rejected_count{0};
    std::chrono::milliseconds time_until_retry{0};  // Only non-zero while open
};

/**
 * How a call got through the breaker
 */
enum class Admission {
    normal,     // Circuit closed
    trial       // Half-open trial call
};

template <typename Callable>
using admitted_result_t = typename std::conditional_t<
    std::is_invocable_v<Callable&, Admission>,
    std::invoke_result<Callable&, Admission>,
    std::invoke_result<Callable&>>::type;

using StateChangeCallback = std::function<void(BreakerState old_state, BreakerState new_state)>;

class CircuitBreaker {
public:
    explicit CircuitBreaker(const CircuitBreakerConfig& config = {},
                            const util::Clock& clock = util::steady_clock());

    // Non-copyable
    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * Run a backend call under breaker protection
     *
     * BackendError thrown by the callable is recorded as a failure and
     * rethrown. Any other exception is rethrown without touching the
     * counters. A callable taking an Admission learns whether it runs as
     * a half-open trial call.
     *
     * @throws pipeline::BreakerOpenError when the call is short-circuited
     */
    template <typename Callable>
    auto execute(Callable&& callable) -> admitted_result_t<Callable> {
        using Result = admitted_result_t<Callable>;

        const Ticket ticket = acquire();
        const Admission admission = ticket.probe ? Admission::trial : Admission::normal;
        auto invoke = [&]() -> Result {
            if constexpr (std::is_invocable_v<Callable&, Admission>) {
                return callable(admission);
            } else {
                return callable();
            }
        };

        try {
            if constexpr (std::is_void_v<Result>) {
                invoke();
                record_success(ticket);
            } else {
                Result result = invoke();
                record_success(ticket);
                return result;
            }
        } catch (const pipeline::BackendError&) {
            record_failure(ticket);
            throw;
        } catch (...) {
            release(ticket);
            throw;
        }
    }

    BreakerState state() const;

    std::uint32_t failure_count() const;

    BreakerStatus status() const;

    /**
     * Manually close the circuit and clear all counters
     */
    void reset();

    /**
     * Register callback for state transitions (invoked outside the lock)
     */
    void on_state_change(StateChangeCallback callback);

    const CircuitBreakerConfig& config() const noexcept { return config_; }

private:
    /**
     * Admission record for one call
     *
     * The generation changes on every transition, so outcomes of calls
     * admitted under an earlier state are ignored.
     */
    struct Ticket {
        std::uint64_t generation{0};
        bool probe{false};
    };

    using Transition = std::pair<BreakerState, BreakerState>;

    Ticket acquire();
    void record_success(const Ticket& ticket);
    void record_failure(const Ticket& ticket);
    void release(const Ticket& ticket);

    /**
     * Change state; must be called with the lock held
     */
    Transition transition_to(BreakerState new_state);

    void notify(const std::optional<Transition>& transition);

    std::chrono::milliseconds time_until_retry_locked() const;

    CircuitBreakerConfig config_;
    const util::Clock& clock_;

    mutable std::mutex mutex_;
    BreakerState state_{BreakerState::closed};
    std::uint32_t consecutive_failures_{0};
    std::uint32_t consecutive_successes_{0};
    std::uint32_t probes_in_flight_{0};
    std::uint64_t rejected_{0};
    std::uint64_t generation_{0};
    util::Clock::time_point opened_at_{};

    std::vector<StateChangeCallback> callbacks_;
};

} // namespace voxrelay::breaker

#endif // VOXRELAY_BREAKER_CIRCUIT_BREAKER_HPP
