/**
 * VOXRELAY - Realtime Voice Gateway
 * Circuit Breaker - Implementation
 */

#include "breaker/circuit_breaker.hpp"

#include "util/logger.hpp"

#include <exception>

namespace voxrelay::breaker {

using util::log_component::Breaker;

CircuitBreaker::CircuitBreaker(const CircuitBreakerConfig& config, const util::Clock& clock)
    : config_(config)
    , clock_(clock)
{
    VOXRELAY_LOG_INFO(Breaker, "Circuit breaker initialized for {}: failure_threshold={}, "
                      "recovery_timeout={}s, success_threshold={}",
                      config_.name, config_.failure_threshold,
                      config_.recovery_timeout.count(), config_.success_threshold);
}

CircuitBreaker::Ticket CircuitBreaker::acquire() {
    std::optional<Transition> transition;
    Ticket ticket;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ == BreakerState::open) {
            if (clock_.now() - opened_at_ < config_.recovery_timeout) {
                ++rejected_;
                auto wait = std::chrono::duration_cast<std::chrono::seconds>(time_until_retry_locked());
                throw pipeline::BreakerOpenError(
                    "Circuit breaker is open for " + config_.name +
                    ", retry after " + std::to_string(wait.count()) + "s");
            }
            transition = transition_to(BreakerState::half_open);
        }

        if (state_ == BreakerState::half_open) {
            if (probes_in_flight_ >= config_.half_open_max_calls) {
                ++rejected_;
                throw pipeline::BreakerOpenError(
                    "Circuit breaker is half-open for " + config_.name + ", probe in progress");
            }
            ++probes_in_flight_;
            ticket.probe = true;
        }

        ticket.generation = generation_;
    }

    notify(transition);
    return ticket;
}

void CircuitBreaker::record_success(const Ticket& ticket) {
    std::optional<Transition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ticket.generation != generation_) {
            return;
        }

        if (state_ == BreakerState::half_open) {
            if (ticket.probe && probes_in_flight_ > 0) {
                --probes_in_flight_;
            }
            ++consecutive_successes_;
            VOXRELAY_LOG_DEBUG(Breaker, "{}: success while half-open ({}/{})",
                               config_.name, consecutive_successes_, config_.success_threshold);

            if (consecutive_successes_ >= config_.success_threshold) {
                transition = transition_to(BreakerState::closed);
            }
        } else if (state_ == BreakerState::closed) {
            consecutive_failures_ = 0;
        }
    }

    notify(transition);
}

void CircuitBreaker::record_failure(const Ticket& ticket) {
    std::optional<Transition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ticket.generation != generation_) {
            return;
        }

        if (state_ == BreakerState::half_open) {
            // A single failing probe reopens the circuit
            transition = transition_to(BreakerState::open);
            consecutive_failures_ = 1;
        } else if (state_ == BreakerState::closed) {
            ++consecutive_failures_;
            VOXRELAY_LOG_WARN(Breaker, "{}: failure recorded ({}/{})",
                              config_.name, consecutive_failures_, config_.failure_threshold);

            if (consecutive_failures_ >= config_.failure_threshold) {
                transition = transition_to(BreakerState::open);
            }
        }
    }

    notify(transition);
}

void CircuitBreaker::release(const Ticket& ticket) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ticket.generation == generation_ && ticket.probe && probes_in_flight_ > 0) {
        --probes_in_flight_;
    }
}

CircuitBreaker::Transition CircuitBreaker::transition_to(BreakerState new_state) {
    BreakerState old_state = state_;
    state_ = new_state;
    ++generation_;
    probes_in_flight_ = 0;

    switch (new_state) {
        case BreakerState::open:
            opened_at_ = clock_.now();
            consecutive_successes_ = 0;
            break;
        case BreakerState::half_open:
            consecutive_failures_ = 0;
            consecutive_successes_ = 0;
            break;
        case BreakerState::closed:
            consecutive_failures_ = 0;
            consecutive_successes_ = 0;
            break;
    }

    if (new_state == BreakerState::open) {
        VOXRELAY_LOG_ERROR(Breaker, "{}: {} -> {}", config_.name,
                           to_string(old_state), to_string(new_state));
    } else {
        VOXRELAY_LOG_INFO(Breaker, "{}: {} -> {}", config_.name,
                          to_string(old_state), to_string(new_state));
    }

    return {old_state, new_state};
}

void CircuitBreaker::notify(const std::optional<Transition>& transition) {
    if (!transition) {
        return;
    }

    std::vector<StateChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks = callbacks_;
    }

    for (const auto& callback : callbacks) {
        try {
            callback(transition->first, transition->second);
        } catch (const std::exception& e) {
            VOXRELAY_LOG_ERROR(Breaker, "State change callback error: {}", e.what());
        }
    }
}

BreakerState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::uint32_t CircuitBreaker::failure_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_failures_;
}

BreakerStatus CircuitBreaker::status() const {
    std::lock_guard<std::mutex> lock(mutex_);

    BreakerStatus status;
    status.name = config_.name;
    status.state = state_;
    status.failure_count = consecutive_failures_;
    status.success_count = consecutive_successes_;
    status.rejected_count = rejected_;
    status.time_until_retry = time_until_retry_locked();
    return status;
}

void CircuitBreaker::reset() {
    std::optional<Transition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        VOXRELAY_LOG_INFO(Breaker, "{}: manual reset", config_.name);
        if (state_ != BreakerState::closed) {
            transition = transition_to(BreakerState::closed);
        } else {
            ++generation_;
            consecutive_failures_ = 0;
            consecutive_successes_ = 0;
        }
    }

    notify(transition);
}

void CircuitBreaker::on_state_change(StateChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.push_back(std::move(callback));
}

std::chrono::milliseconds CircuitBreaker::time_until_retry_locked() const {
    if (state_ != BreakerState::open) {
        return std::chrono::milliseconds{0};
    }

    auto elapsed = clock_.now() - opened_at_;
    auto remaining = config_.recovery_timeout - elapsed;
    if (remaining <= std::chrono::steady_clock::duration::zero()) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::ceil<std::chrono::milliseconds>(remaining);
}

} // namespace voxrelay::breaker
