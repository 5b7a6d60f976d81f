/**
 * VOXRELAY - Realtime Voice Gateway
 * Clock - Injectable time source and sleeper
 *
 * Components that make time-based decisions (circuit breaker recovery,
 * cache TTL, retry backoff) take these by reference so tests can drive time.
 */

#ifndef VOXRELAY_UTIL_CLOCK_HPP
#define VOXRELAY_UTIL_CLOCK_HPP

#include <chrono>
#include <thread>

namespace voxrelay::util {

/**
 * Monotonic time source
 */
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

/**
 * Blocking delay used between retry attempts
 */
class Sleeper {
public:
    virtual ~Sleeper() = default;
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class SteadyClock final : public Clock {
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }
};

class ThreadSleeper final : public Sleeper {
public:
    void sleep_for(std::chrono::milliseconds duration) override {
        std::this_thread::sleep_for(duration);
    }
};

/**
 * Process-wide defaults for production wiring
 */
inline Clock& steady_clock() {
    static SteadyClock clock;
    return clock;
}

inline Sleeper& thread_sleeper() {
    static ThreadSleeper sleeper;
    return sleeper;
}

} // namespace voxrelay::util

#endif // VOXRELAY_UTIL_CLOCK_HPP
