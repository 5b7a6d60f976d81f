/**
 * VOXRELAY - Realtime Voice Gateway
 * Unit tests for the circuit breaker state machine
 */

#include "breaker/circuit_breaker.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <latch>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace voxrelay;
using breaker::BreakerState;
using voxrelay::testing::ManualClock;

class CircuitBreakerTest : public ::testing::Test {
   protected:
    ManualClock clock;
    breaker::CircuitBreaker breaker{breaker::CircuitBreakerConfig{}, clock};

    void fail_once() {
        EXPECT_THROW(breaker.execute([]() -> int {
            throw pipeline::TransientBackendError("timeout");
        }), pipeline::TransientBackendError);
    }

    int succeed_once() {
        return breaker.execute([] { return 7; });
    }

    void trip() {
        for (int i = 0; i < 5; ++i) {
            fail_once();
        }
        ASSERT_EQ(breaker.state(), BreakerState::open);
    }
};

TEST_F(CircuitBreakerTest, StartsClosed) {
    EXPECT_EQ(breaker.state(), BreakerState::closed);
    EXPECT_EQ(breaker.failure_count(), 0u);
}

TEST_F(CircuitBreakerTest, ReturnsCallableResult) {
    EXPECT_EQ(succeed_once(), 7);
}

TEST_F(CircuitBreakerTest, OpensAfterFiveConsecutiveFailures) {
    for (int i = 0; i < 4; ++i) {
        fail_once();
    }
    EXPECT_EQ(breaker.state(), BreakerState::closed);
    EXPECT_EQ(breaker.failure_count(), 4u);

    fail_once();
    EXPECT_EQ(breaker.state(), BreakerState::open);
}

TEST_F(CircuitBreakerTest, SuccessResetsFailureCount) {
    for (int i = 0; i < 4; ++i) {
        fail_once();
    }
    succeed_once();
    EXPECT_EQ(breaker.failure_count(), 0u);

    fail_once();
    EXPECT_EQ(breaker.state(), BreakerState::closed);
}

TEST_F(CircuitBreakerTest, PermanentFailuresAlsoCount) {
    for (int i = 0; i < 5; ++i) {
        EXPECT_THROW(breaker.execute([]() -> int {
            throw pipeline::PermanentBackendError("quota");
        }), pipeline::PermanentBackendError);
    }
    EXPECT_EQ(breaker.state(), BreakerState::open);
}

TEST_F(CircuitBreakerTest, NonBackendErrorsAreNotCounted) {
    for (int i = 0; i < 10; ++i) {
        EXPECT_THROW(breaker.execute([]() -> int {
            throw std::logic_error("bug");
        }), std::logic_error);
    }
    EXPECT_EQ(breaker.state(), BreakerState::closed);
    EXPECT_EQ(breaker.failure_count(), 0u);
}

TEST_F(CircuitBreakerTest, OpenCircuitRejectsWithoutCallingBackend) {
    trip();

    int calls = 0;
    EXPECT_THROW(breaker.execute([&] { return ++calls; }), pipeline::BreakerOpenError);
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(breaker.status().rejected_count, 1u);
}

TEST_F(CircuitBreakerTest, StaysOpenBeforeRecoveryTimeout) {
    trip();
    clock.advance(std::chrono::seconds(59));
    EXPECT_THROW(succeed_once(), pipeline::BreakerOpenError);
    EXPECT_EQ(breaker.state(), BreakerState::open);
}

TEST_F(CircuitBreakerTest, AdmitsSingleProbeAfterRecoveryTimeout) {
    trip();
    clock.advance(std::chrono::seconds(60));

    int probe_calls = 0;
    int nested_calls = 0;
    breaker.execute([&] {
        ++probe_calls;
        EXPECT_EQ(breaker.state(), BreakerState::half_open);
        // A concurrent call while the probe is in flight is rejected
        EXPECT_THROW(breaker.execute([&] { return ++nested_calls; }), pipeline::BreakerOpenError);
        return 0;
    });

    EXPECT_EQ(probe_calls, 1);
    EXPECT_EQ(nested_calls, 0);
    EXPECT_EQ(breaker.state(), BreakerState::half_open);
}

TEST_F(CircuitBreakerTest, CallableLearnsWhetherItIsATrialCall) {
    auto admission_of = [this] {
        return breaker.execute([](breaker::Admission admission) { return admission; });
    };

    EXPECT_EQ(admission_of(), breaker::Admission::normal);

    trip();
    clock.advance(std::chrono::seconds(60));
    EXPECT_EQ(admission_of(), breaker::Admission::trial);
}

TEST_F(CircuitBreakerTest, ClosesAfterTwoProbeSuccesses) {
    trip();
    clock.advance(std::chrono::seconds(60));

    succeed_once();
    EXPECT_EQ(breaker.state(), BreakerState::half_open);

    succeed_once();
    EXPECT_EQ(breaker.state(), BreakerState::closed);
    EXPECT_EQ(breaker.failure_count(), 0u);
}

TEST_F(CircuitBreakerTest, ProbeFailureReopens) {
    trip();
    clock.advance(std::chrono::seconds(60));

    fail_once();
    EXPECT_EQ(breaker.state(), BreakerState::open);

    // The recovery window restarts from the failed probe
    clock.advance(std::chrono::seconds(30));
    EXPECT_THROW(succeed_once(), pipeline::BreakerOpenError);
}

TEST_F(CircuitBreakerTest, StatusReportsTimeUntilRetry) {
    trip();
    clock.advance(std::chrono::seconds(20));

    auto status = breaker.status();
    EXPECT_EQ(status.state, BreakerState::open);
    EXPECT_EQ(status.name, "synthesis");
    EXPECT_EQ(status.time_until_retry, std::chrono::milliseconds(40000));
}

TEST_F(CircuitBreakerTest, ManualResetCloses) {
    trip();
    breaker.reset();

    EXPECT_EQ(breaker.state(), BreakerState::closed);
    EXPECT_EQ(breaker.failure_count(), 0u);
    EXPECT_EQ(succeed_once(), 7);
}

TEST_F(CircuitBreakerTest, StateChangesAreReported) {
    std::vector<std::pair<BreakerState, BreakerState>> transitions;
    breaker.on_state_change([&](BreakerState from, BreakerState to) {
        transitions.emplace_back(from, to);
    });

    trip();
    clock.advance(std::chrono::seconds(60));
    succeed_once();
    succeed_once();

    ASSERT_EQ(transitions.size(), 3u);
    EXPECT_EQ(transitions[0], std::make_pair(BreakerState::closed, BreakerState::open));
    EXPECT_EQ(transitions[1], std::make_pair(BreakerState::open, BreakerState::half_open));
    EXPECT_EQ(transitions[2], std::make_pair(BreakerState::half_open, BreakerState::closed));
}

// ============================================================
// Concurrent callers
// ============================================================

namespace {

struct TrialRace {
    int entered{0};
    int rejected{0};
};

// Admitted calls hold their trial slot until every caller has either entered or been turned away
TrialRace race_callers(breaker::CircuitBreaker& cb, int threads) {
    std::atomic<int> entered{0};
    std::atomic<int> rejected{0};
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::latch start(threads);

    std::vector<std::thread> workers;
    for (int i = 0; i < threads; ++i) {
        workers.emplace_back([&] {
            start.arrive_and_wait();
            try {
                cb.execute([&] {
                    ++entered;
                    released.wait();
                    return 0;
                });
            } catch (const pipeline::BreakerOpenError&) {
                ++rejected;
            }
        });
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (entered.load() + rejected.load() < threads &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    release.set_value();

    for (auto& worker : workers) {
        worker.join();
    }
    return TrialRace{entered.load(), rejected.load()};
}

} // namespace

TEST(CircuitBreakerConcurrencyTest, ConcurrentFailuresAreCountedExactly) {
    ManualClock clock;
    breaker::CircuitBreakerConfig config;
    config.failure_threshold = 1000;
    breaker::CircuitBreaker cb(config, clock);

    constexpr int threads = 16;
    constexpr int calls_per_thread = 25;
    std::atomic<int> failures{0};
    std::latch start(threads);

    std::vector<std::thread> workers;
    for (int i = 0; i < threads; ++i) {
        workers.emplace_back([&] {
            start.arrive_and_wait();
            for (int n = 0; n < calls_per_thread; ++n) {
                try {
                    cb.execute([]() -> int { throw pipeline::TransientBackendError("timeout"); });
                } catch (const pipeline::TransientBackendError&) {
                    ++failures;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(failures.load(), threads * calls_per_thread);
    EXPECT_EQ(cb.failure_count(), static_cast<std::uint32_t>(threads * calls_per_thread));
    EXPECT_EQ(cb.state(), BreakerState::closed);
}

TEST(CircuitBreakerConcurrencyTest, ConcurrentFailuresOpenCircuitOnce) {
    ManualClock clock;
    breaker::CircuitBreaker cb(breaker::CircuitBreakerConfig{}, clock);

    std::atomic<int> opened{0};
    cb.on_state_change([&](BreakerState, BreakerState to) {
        if (to == BreakerState::open) {
            ++opened;
        }
    });

    constexpr int threads = 32;
    std::atomic<int> backend_calls{0};
    std::atomic<int> failed{0};
    std::atomic<int> rejected{0};
    std::latch start(threads);

    std::vector<std::thread> workers;
    for (int i = 0; i < threads; ++i) {
        workers.emplace_back([&] {
            start.arrive_and_wait();
            try {
                cb.execute([&]() -> int {
                    ++backend_calls;
                    throw pipeline::TransientBackendError("timeout");
                });
            } catch (const pipeline::TransientBackendError&) {
                ++failed;
            } catch (const pipeline::BreakerOpenError&) {
                ++rejected;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(opened.load(), 1);
    EXPECT_EQ(cb.state(), BreakerState::open);
    // Failures from calls admitted before the trip do not count twice
    EXPECT_EQ(cb.failure_count(), 5u);
    EXPECT_GE(backend_calls.load(), 5);
    EXPECT_EQ(failed.load(), backend_calls.load());
    EXPECT_EQ(backend_calls.load() + rejected.load(), threads);
}

TEST_F(CircuitBreakerTest, RacingCallersAfterRecoveryShareOneTrialSlot) {
    std::atomic<int> half_opened{0};
    breaker.on_state_change([&](BreakerState, BreakerState to) {
        if (to == BreakerState::half_open) {
            ++half_opened;
        }
    });

    trip();
    clock.advance(std::chrono::seconds(61));

    auto race = race_callers(breaker, 12);

    EXPECT_EQ(race.entered, 1);
    EXPECT_EQ(race.rejected, 11);
    EXPECT_EQ(half_opened.load(), 1);
    EXPECT_EQ(breaker.state(), BreakerState::half_open);
}

TEST(CircuitBreakerConcurrencyTest, HalfOpenAdmitsConfiguredTrialCount) {
    ManualClock clock;
    breaker::CircuitBreakerConfig config;
    config.failure_threshold = 1;
    config.half_open_max_calls = 3;
    config.success_threshold = 10;
    breaker::CircuitBreaker cb(config, clock);

    EXPECT_THROW(cb.execute([]() -> int { throw pipeline::TransientBackendError("timeout"); }),
                 pipeline::TransientBackendError);
    ASSERT_EQ(cb.state(), BreakerState::open);
    clock.advance(std::chrono::seconds(61));

    auto race = race_callers(cb, 12);

    EXPECT_EQ(race.entered, 3);
    EXPECT_EQ(race.rejected, 9);
    EXPECT_EQ(cb.state(), BreakerState::half_open);
}

TEST(BreakerStateTest, Names) {
    EXPECT_EQ(breaker::to_string(BreakerState::closed), "closed");
    EXPECT_EQ(breaker::to_string(BreakerState::open), "open");
    EXPECT_EQ(breaker::to_string(BreakerState::half_open), "half_open");
}
