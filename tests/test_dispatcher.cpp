/**
 * VOXRELAY - Realtime Voice Gateway
 * Unit tests for the pipeline dispatcher
 */

#include "pipeline/dispatcher.hpp"

#include "cache/lru_cache.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <future>
#include <thread>
#include <variant>
#include <vector>

using namespace voxrelay;
using namespace std::chrono_literals;
using voxrelay::testing::FakeSynthesisBackend;
using voxrelay::testing::FakeTranscriptionBackend;
using voxrelay::testing::FixedSentimentScorer;
using voxrelay::testing::FlakyStore;
using voxrelay::testing::GatedSynthesisBackend;
using voxrelay::testing::ManualClock;
using voxrelay::testing::RecordingSleeper;
using voxrelay::testing::TaggingPostProcessor;
using Outcome = FakeSynthesisBackend::Outcome;

namespace {

const pipeline::AudioResponse& as_audio(const pipeline::PipelineResponse& response) {
    return std::get<pipeline::AudioResponse>(response);
}

std::string failure_message(const pipeline::PipelineResponse& response) {
    const auto* failure = std::get_if<pipeline::FailureResponse>(&response);
    return failure ? failure->message : std::string("<not a failure>");
}

} // namespace

class DispatcherTest : public ::testing::Test {
   protected:
    ManualClock clock;
    RecordingSleeper sleeper;

    std::shared_ptr<util::Stats> stats = std::make_shared<util::Stats>();
    std::shared_ptr<FlakyStore> store = std::make_shared<FlakyStore>();
    std::shared_ptr<FakeSynthesisBackend> synthesis = std::make_shared<FakeSynthesisBackend>();
    std::shared_ptr<FakeTranscriptionBackend> transcription = std::make_shared<FakeTranscriptionBackend>();
    std::shared_ptr<breaker::CircuitBreaker> circuit_breaker =
        std::make_shared<breaker::CircuitBreaker>(breaker::CircuitBreakerConfig{}, clock);

    pipeline::PipelineContext make_context(std::shared_ptr<backend::SynthesisBackend> backend) {
        pipeline::PipelineContext context;
        context.stats = stats;
        context.cache = std::make_shared<cache::AudioCache>(store, *stats);
        context.breaker = circuit_breaker;
        context.synthesis = std::move(backend);
        context.transcription = transcription;
        context.sentiment = std::make_shared<FixedSentimentScorer>();
        context.clock = &clock;
        context.sleeper = &sleeper;
        return context;
    }

    std::unique_ptr<pipeline::PipelineDispatcher> make_dispatcher() {
        return std::make_unique<pipeline::PipelineDispatcher>(make_context(synthesis));
    }

    static pipeline::PipelineRequest text(std::string value) {
        return pipeline::SynthesisRequest{std::move(value)};
    }
};

// ============================================================
// Construction
// ============================================================

TEST_F(DispatcherTest, MissingCollaboratorIsRejected) {
    auto context = make_context(synthesis);
    context.transcription.reset();
    EXPECT_THROW(pipeline::PipelineDispatcher{std::move(context)}, std::invalid_argument);
}

// ============================================================
// Synthesis
// ============================================================

TEST_F(DispatcherTest, FirstRequestMissesAndCaches) {
    auto dispatcher = make_dispatcher();

    auto response = dispatcher->handle(text("Hello world"));
    const auto& audio = as_audio(response);

    EXPECT_EQ(audio.audio, "audio:Hello world");
    EXPECT_DOUBLE_EQ(audio.duration, 1.5);
    EXPECT_FALSE(audio.cached);
    EXPECT_EQ(audio.sentiment.label, "positive");
    EXPECT_EQ(synthesis->calls(), 1);
    EXPECT_EQ(store->size(), 1u);
}

TEST_F(DispatcherTest, RepeatRequestIsServedFromCache) {
    auto dispatcher = make_dispatcher();

    dispatcher->handle(text("Hello world"));
    auto response = dispatcher->handle(text("  hello   WORLD "));
    const auto& audio = as_audio(response);

    EXPECT_TRUE(audio.cached);
    EXPECT_EQ(audio.audio, "audio:Hello world");
    EXPECT_EQ(synthesis->calls(), 1);

    auto snapshot = dispatcher->stats();
    EXPECT_EQ(snapshot.cache_hits, 1u);
    EXPECT_EQ(snapshot.cache_misses, 1u);
    EXPECT_EQ(snapshot.synthesis_requests, 2u);
}

TEST_F(DispatcherTest, CacheHitNeverWaitsOnBackend) {
    auto dispatcher = make_dispatcher();
    dispatcher->handle(text("Hello world"));

    // A backend call would now take five seconds
    synthesis->set_delay(5000ms);

    auto start = std::chrono::steady_clock::now();
    auto response = dispatcher->handle(text("Hello world"));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(as_audio(response).cached);
    EXPECT_LT(elapsed, 1000ms);
    EXPECT_EQ(synthesis->calls(), 1);
}

TEST_F(DispatcherTest, LatencyComesFromInjectedClock) {
    auto dispatcher = make_dispatcher();
    auto response = dispatcher->handle(text("Hello world"));
    EXPECT_EQ(as_audio(response).latency, 0ms);
}

TEST_F(DispatcherTest, PostProcessedAudioIsWhatGetsCached) {
    auto context = make_context(synthesis);
    context.post_processor = std::make_shared<TaggingPostProcessor>();
    pipeline::PipelineDispatcher dispatcher(std::move(context));

    auto first = dispatcher.handle(text("Hello"));
    auto second = dispatcher.handle(text("Hello"));

    EXPECT_EQ(as_audio(first).audio, "normalized:audio:Hello");
    EXPECT_EQ(as_audio(second).audio, "normalized:audio:Hello");
    EXPECT_TRUE(as_audio(second).cached);
}

TEST_F(DispatcherTest, NegativeDurationIsClamped) {
    synthesis->set_duration(-3.0);
    auto dispatcher = make_dispatcher();
    EXPECT_DOUBLE_EQ(as_audio(dispatcher->handle(text("Hello"))).duration, 0.0);
}

TEST_F(DispatcherTest, EmptyTextIsRejected) {
    auto dispatcher = make_dispatcher();

    EXPECT_EQ(failure_message(dispatcher->handle(text(""))), "Empty text");
    EXPECT_EQ(failure_message(dispatcher->handle(text("   \t"))), "Empty text");
    EXPECT_EQ(synthesis->calls(), 0);
    EXPECT_EQ(dispatcher->stats().failed_requests, 2u);
}

TEST_F(DispatcherTest, TransientFailureIsRetriedWithBackoff) {
    synthesis->push(Outcome::transient, 2);
    auto dispatcher = make_dispatcher();

    auto response = dispatcher->handle(text("Hello"));

    EXPECT_FALSE(as_audio(response).cached);
    EXPECT_EQ(synthesis->calls(), 3);
    EXPECT_EQ(sleeper.delays(), (std::vector<std::chrono::milliseconds>{1000ms, 2000ms}));
    EXPECT_EQ(circuit_breaker->failure_count(), 0u);
}

TEST_F(DispatcherTest, ExhaustedRetriesReportTransientFailure) {
    synthesis->push(Outcome::transient, 3);
    auto dispatcher = make_dispatcher();

    auto response = dispatcher->handle(text("Hello"));

    EXPECT_EQ(failure_message(response), "synthesis failed: transient backend error");
    EXPECT_EQ(synthesis->calls(), 3);
    EXPECT_EQ(circuit_breaker->failure_count(), 1u);
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(DispatcherTest, PermanentFailureIsNotRetried) {
    synthesis->push(Outcome::permanent);
    auto dispatcher = make_dispatcher();

    auto response = dispatcher->handle(text("Hello"));

    EXPECT_EQ(failure_message(response), "synthesis failed: permanent backend error");
    EXPECT_EQ(synthesis->calls(), 1);
    EXPECT_TRUE(sleeper.delays().empty());
}

TEST_F(DispatcherTest, OpenBreakerShortCircuits) {
    synthesis->push(Outcome::permanent, 5);
    auto dispatcher = make_dispatcher();

    for (int i = 0; i < 5; ++i) {
        dispatcher->handle(text("request " + std::to_string(i)));
    }
    ASSERT_EQ(circuit_breaker->state(), breaker::BreakerState::open);

    auto response = dispatcher->handle(text("one more"));
    EXPECT_EQ(failure_message(response), "synthesis unavailable: circuit open");
    EXPECT_EQ(synthesis->calls(), 5);

    auto snapshot = dispatcher->stats();
    EXPECT_EQ(snapshot.breaker_state, "open");
    EXPECT_EQ(snapshot.failed_requests, 6u);
}

TEST_F(DispatcherTest, CachedAudioIsServedWhileBreakerIsOpen) {
    auto dispatcher = make_dispatcher();
    dispatcher->handle(text("Hello"));

    synthesis->push(Outcome::permanent, 5);
    for (int i = 0; i < 5; ++i) {
        dispatcher->handle(text("fail " + std::to_string(i)));
    }
    ASSERT_EQ(circuit_breaker->state(), breaker::BreakerState::open);

    EXPECT_TRUE(as_audio(dispatcher->handle(text("Hello"))).cached);
}

TEST_F(DispatcherTest, BreakerRecoversThroughProbes) {
    synthesis->push(Outcome::permanent, 5);
    auto dispatcher = make_dispatcher();
    for (int i = 0; i < 5; ++i) {
        dispatcher->handle(text("fail " + std::to_string(i)));
    }

    clock.advance(60s);
    EXPECT_FALSE(as_audio(dispatcher->handle(text("probe one"))).cached);
    EXPECT_FALSE(as_audio(dispatcher->handle(text("probe two"))).cached);
    EXPECT_EQ(circuit_breaker->state(), breaker::BreakerState::closed);
}

TEST_F(DispatcherTest, FailingTrialCallIsNotRetried) {
    synthesis->push(Outcome::permanent, 5);
    auto dispatcher = make_dispatcher();
    for (int i = 0; i < 5; ++i) {
        dispatcher->handle(text("fail " + std::to_string(i)));
    }
    ASSERT_EQ(circuit_breaker->state(), breaker::BreakerState::open);

    clock.advance(60s);
    synthesis->push(Outcome::transient);
    auto response = dispatcher->handle(text("trial"));

    EXPECT_EQ(failure_message(response), "synthesis failed: transient backend error");
    EXPECT_EQ(synthesis->calls(), 6);
    EXPECT_TRUE(sleeper.delays().empty());
    EXPECT_EQ(circuit_breaker->state(), breaker::BreakerState::open);
}

TEST_F(DispatcherTest, ManualResetClosesBreaker) {
    synthesis->push(Outcome::permanent, 5);
    auto dispatcher = make_dispatcher();
    for (int i = 0; i < 5; ++i) {
        dispatcher->handle(text("fail " + std::to_string(i)));
    }

    dispatcher->reset_breaker();
    EXPECT_EQ(dispatcher->breaker_status().state, breaker::BreakerState::closed);
    EXPECT_FALSE(as_audio(dispatcher->handle(text("Hello"))).cached);
}

TEST_F(DispatcherTest, UnreachableStoreStillSynthesizes) {
    store->set_down(true);
    auto dispatcher = make_dispatcher();

    auto first = dispatcher->handle(text("Hello"));
    auto second = dispatcher->handle(text("Hello"));

    EXPECT_FALSE(as_audio(first).cached);
    EXPECT_FALSE(as_audio(second).cached);
    EXPECT_EQ(synthesis->calls(), 2);
    EXPECT_FALSE(dispatcher->health().cache_reachable);
}

TEST_F(DispatcherTest, ConcurrentMissesShareOneBackendCall) {
    auto gated = std::make_shared<GatedSynthesisBackend>();
    pipeline::PipelineDispatcher dispatcher(make_context(gated));

    auto leader = std::async(std::launch::async, [&] {
        return dispatcher.handle(text("Hello world"));
    });
    ASSERT_TRUE(gated->wait_until_entered(5000ms));

    std::vector<std::future<pipeline::PipelineResponse>> followers;
    for (int i = 0; i < 3; ++i) {
        followers.push_back(std::async(std::launch::async, [&] {
            return dispatcher.handle(text("hello WORLD"));
        }));
    }

    // Give the followers time to join the in-flight call
    std::this_thread::sleep_for(200ms);
    gated->release();

    EXPECT_EQ(as_audio(leader.get()).audio, "gated:Hello world");
    for (auto& follower : followers) {
        auto response = follower.get();
        EXPECT_EQ(as_audio(response).audio, "gated:Hello world");
    }
    EXPECT_EQ(gated->calls(), 1);
}

TEST_F(DispatcherTest, UnknownTypeIsRejected) {
    auto dispatcher = make_dispatcher();
    auto response = dispatcher->handle(pipeline::UnknownRequest{"video"});
    EXPECT_EQ(failure_message(response), "Invalid message type");
    EXPECT_EQ(dispatcher->stats().failed_requests, 1u);
}

// ============================================================
// Transcription
// ============================================================

TEST_F(DispatcherTest, TranscriptionPassesAudioAndHint) {
    auto dispatcher = make_dispatcher();

    auto response = dispatcher->handle(pipeline::TranscriptionRequest{"PCMDATA", std::string("de")});
    const auto& transcript = std::get<pipeline::TranscriptResponse>(response);

    EXPECT_EQ(transcript.text, "hello there");
    EXPECT_EQ(transcript.language, "en");
    EXPECT_DOUBLE_EQ(transcript.language_probability, 0.98);
    EXPECT_EQ(transcript.sentiment.label, "positive");
    EXPECT_EQ(transcription->last_audio(), "PCMDATA");
    ASSERT_TRUE(transcription->last_hint().has_value());
    EXPECT_EQ(*transcription->last_hint(), "de");
    EXPECT_EQ(dispatcher->stats().transcription_requests, 1u);
}

TEST_F(DispatcherTest, EmptyAudioIsRejected) {
    auto dispatcher = make_dispatcher();
    auto response = dispatcher->handle(pipeline::TranscriptionRequest{"", std::nullopt});
    EXPECT_EQ(failure_message(response), "Empty audio data");
    EXPECT_EQ(transcription->calls(), 0);
}

TEST_F(DispatcherTest, TranscriptionErrorsAreCategorized) {
    auto dispatcher = make_dispatcher();
    const pipeline::PipelineRequest request = pipeline::TranscriptionRequest{"PCM", std::nullopt};

    transcription->fail_with([] { throw pipeline::TransientBackendError("timeout"); });
    EXPECT_EQ(failure_message(dispatcher->handle(request)), "service error: transient");

    transcription->fail_with([] { throw pipeline::PermanentBackendError("unsupported"); });
    EXPECT_EQ(failure_message(dispatcher->handle(request)), "service error: permanent");

    transcription->fail_with([] { throw pipeline::ValidationError("bad language"); });
    EXPECT_EQ(failure_message(dispatcher->handle(request)), "service error: validation");

    transcription->fail_with([] { throw std::runtime_error("boom"); });
    EXPECT_EQ(failure_message(dispatcher->handle(request)), "service error: internal");

    EXPECT_EQ(dispatcher->stats().failed_requests, 4u);
}

TEST_F(DispatcherTest, TranscriptionDoesNotTouchBreaker) {
    auto dispatcher = make_dispatcher();
    transcription->fail_with([] { throw pipeline::TransientBackendError("timeout"); });

    for (int i = 0; i < 6; ++i) {
        dispatcher->handle(pipeline::TranscriptionRequest{"PCM", std::nullopt});
    }
    EXPECT_EQ(circuit_breaker->state(), breaker::BreakerState::closed);
    EXPECT_EQ(transcription->calls(), 6);
}

// ============================================================
// Health
// ============================================================

TEST_F(DispatcherTest, HealthReportsCacheAndBreaker) {
    auto dispatcher = make_dispatcher();

    auto health = dispatcher->health();
    EXPECT_TRUE(health.cache_reachable);
    EXPECT_EQ(health.breaker_state, breaker::BreakerState::closed);
}
