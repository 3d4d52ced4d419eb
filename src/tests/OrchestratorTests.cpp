// SPDX-License-Identifier: Apache-2.0
#include <pipeline/SessionOrchestrator.hpp>
#include <process/ProcessRunner.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <latch>
#include <thread>
#include <vector>

#include "PipelineFakes.hpp"
#include "TestUtils.hpp"

using namespace dictum;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

namespace
{

/// @brief Owns a state machine, fakes and an orchestrator wired together.
struct Harness
{
    test::TempDir dir {};
    SessionStateMachine state {};
    test::FakeCapture capture { dir.path() };
    test::MockTranscriber transcriber {};
    test::MockRefiner refiner {};
    test::FakeClipboard clipboard {};
    test::FakeHistory history {};
    test::RecordingNotifier notifier {};

    auto makeOrchestrator(OrchestratorSettings settings = {}) -> SessionOrchestrator
    {
        settings.clipboardRetryDelay = 1ms;
        return SessionOrchestrator(state,
                                   PipelineCollaborators {
                                       .capture = capture,
                                       .transcriber = transcriber,
                                       .refiner = &refiner,
                                       .clipboard = clipboard,
                                       .history = history,
                                       .notifier = notifier,
                                   },
                                   std::move(settings));
    }
};

auto runSession(SessionOrchestrator& orchestrator) -> Result<PipelineOutcome>
{
    REQUIRE(orchestrator.activate().has_value());
    return orchestrator.deactivate().get();
}

} // namespace

TEST_CASE("SessionOrchestrator delivers a transcript to clipboard and history", "[pipeline]")
{
    auto harness = Harness {};
    auto orchestrator = harness.makeOrchestrator({ .language = "de", .sttModel = "ggml-base.bin" });

    REQUIRE(orchestrator.activate().has_value());
    CHECK(harness.state.current() == SessionState::Recording);
    CHECK(orchestrator.isBusy());

    auto const outcome = orchestrator.deactivate().get();
    REQUIRE(outcome.has_value());
    CHECK(outcome->finalText == "hello world");
    CHECK_FALSE(outcome->postProcessed);
    CHECK(outcome->clipboardOk);
    CHECK(outcome->historyPath.has_value());

    CHECK(harness.state.current() == SessionState::Idle);
    CHECK_FALSE(orchestrator.isBusy());
    CHECK(harness.refiner.calls == 0);
    REQUIRE(harness.transcriber.requests.size() == 1);
    CHECK(harness.transcriber.requests[0].language == "de");
    CHECK(harness.clipboard.contents == std::vector<std::string> { "hello world" });

    REQUIRE(harness.history.entries.size() == 1);
    auto const& metadata = harness.history.entries[0].second;
    CHECK(metadata.language == "en");
    CHECK(metadata.sttModel == "ggml-base.bin");
    CHECK(metadata.durationSeconds > 0.9);
    CHECK_FALSE(metadata.postProcessed);

    auto const notifications = harness.notifier.entries();
    REQUIRE(notifications.size() == 1);
    CHECK(notifications[0].kind == NotificationKind::Success);
    CHECK_THAT(notifications[0].message, ContainsSubstring("Copied to clipboard (11 chars)"));

    auto const transitions = harness.state.history();
    REQUIRE(transitions.size() == 3);
    CHECK(transitions[0].trigger == Trigger::Activate);
    CHECK(transitions[1].trigger == Trigger::Deactivate);
    CHECK(transitions[2].to == SessionState::Idle);
    CHECK(transitions[2].trigger == Trigger::Completed);
}

TEST_CASE("SessionOrchestrator refines when enabled", "[pipeline]")
{
    auto harness = Harness {};
    auto orchestrator =
        harness.makeOrchestrator({ .refinementEnabled = true, .glossary = { { "asap", "as soon as possible" } } });

    auto states = std::vector<SessionState> {};
    harness.state.subscribe([&](const Transition& transition) { states.push_back(transition.to); });

    auto const outcome = runSession(orchestrator);
    REQUIRE(outcome.has_value());
    CHECK(outcome->finalText == "Hello, world.");
    CHECK(outcome->postProcessed);
    CHECK(harness.history.entries.at(0).second.postProcessed);
    REQUIRE(harness.refiner.requests.size() == 1);
    CHECK(harness.refiner.requests[0].text == "hello world");
    CHECK(harness.refiner.requests[0].glossary.at("asap") == "as soon as possible");
    CHECK(states
          == std::vector { SessionState::Recording,
                           SessionState::Processing,
                           SessionState::PostProcessing,
                           SessionState::Idle });
}

TEST_CASE("SessionOrchestrator falls back to the transcript when refinement fails", "[pipeline]")
{
    auto harness = Harness {};
    auto orchestrator = harness.makeOrchestrator({ .refinementEnabled = true });

    SECTION("refiner error")
    {
        harness.refiner.result = makeError(ErrorCode::Timeout, "Refinement timed out");
    }

    SECTION("refiner reports no success")
    {
        harness.refiner.result = RefinementResult { .text = "ignored", .succeeded = false };
    }

    auto const outcome = runSession(orchestrator);
    REQUIRE(outcome.has_value());
    CHECK(outcome->finalText == "hello world");
    CHECK_FALSE(outcome->postProcessed);
    CHECK(outcome->clipboardOk);
    CHECK(harness.clipboard.contents.at(0) == "hello world");
    CHECK(harness.state.current() == SessionState::Idle);

    auto const notifications = harness.notifier.entries();
    REQUIRE(notifications.size() == 1);
    CHECK(notifications[0].kind == NotificationKind::Warning);
    CHECK_THAT(notifications[0].message, ContainsSubstring("refinement failed"));
}

TEST_CASE("SessionOrchestrator skips the refiner when refinement is disabled or unavailable", "[pipeline]")
{
    auto harness = Harness {};

    SECTION("disabled")
    {
        auto orchestrator = harness.makeOrchestrator({ .refinementEnabled = false });
        REQUIRE(runSession(orchestrator).has_value());
    }

    SECTION("no refiner")
    {
        auto orchestrator = SessionOrchestrator(harness.state,
                                                PipelineCollaborators {
                                                    .capture = harness.capture,
                                                    .transcriber = harness.transcriber,
                                                    .refiner = nullptr,
                                                    .clipboard = harness.clipboard,
                                                    .history = harness.history,
                                                    .notifier = harness.notifier,
                                                },
                                                OrchestratorSettings { .refinementEnabled = true });
        auto const outcome = runSession(orchestrator);
        REQUIRE(outcome.has_value());
        CHECK_FALSE(outcome->postProcessed);
    }

    CHECK(harness.refiner.calls == 0);
}

TEST_CASE("SessionOrchestrator short-circuits an empty transcript", "[pipeline]")
{
    auto harness = Harness {};
    harness.transcriber.result = TranscriptionResult { .text = "  \n" };
    auto orchestrator = harness.makeOrchestrator({ .refinementEnabled = true });

    auto const outcome = runSession(orchestrator);
    REQUIRE(!outcome.has_value());
    CHECK(outcome.error().code == ErrorCode::NoSpeech);

    CHECK(harness.refiner.calls == 0);
    CHECK(harness.clipboard.calls == 0);
    CHECK(harness.history.calls == 0);
    CHECK(harness.state.current() == SessionState::Idle);
    CHECK_FALSE(orchestrator.isBusy());

    auto const notifications = harness.notifier.entries();
    REQUIRE(notifications.size() == 1);
    CHECK(notifications[0].kind == NotificationKind::Warning);
    CHECK(notifications[0].message == "No speech detected");
}

TEST_CASE("SessionOrchestrator retries the clipboard once", "[pipeline]")
{
    auto harness = Harness {};
    auto orchestrator = harness.makeOrchestrator();

    SECTION("second attempt succeeds")
    {
        harness.clipboard.failCount = 1;
        auto const outcome = runSession(orchestrator);
        REQUIRE(outcome.has_value());
        CHECK(outcome->clipboardOk);
        CHECK(harness.clipboard.calls == 2);
        CHECK(harness.notifier.count(NotificationKind::Success) == 1);
    }

    SECTION("both attempts fail, history is still written")
    {
        harness.clipboard.failCount = 5;
        auto const outcome = runSession(orchestrator);
        REQUIRE(outcome.has_value());
        CHECK_FALSE(outcome->clipboardOk);
        CHECK(outcome->historyPath.has_value());
        CHECK(harness.clipboard.calls == 2);
        CHECK(harness.history.calls == 1);

        auto const notifications = harness.notifier.entries();
        REQUIRE(notifications.size() == 1);
        CHECK(notifications[0].kind == NotificationKind::Warning);
        CHECK_THAT(notifications[0].message, ContainsSubstring("Dictation saved"));
        CHECK_THAT(notifications[0].message, ContainsSubstring("clipboard unavailable"));
    }
}

TEST_CASE("SessionOrchestrator writes the clipboard even if history fails", "[pipeline]")
{
    auto harness = Harness {};
    harness.history.fail = true;
    auto orchestrator = harness.makeOrchestrator();

    auto const outcome = runSession(orchestrator);
    REQUIRE(outcome.has_value());
    CHECK(outcome->clipboardOk);
    CHECK_FALSE(outcome->historyPath.has_value());
    CHECK(harness.clipboard.contents.size() == 1);

    auto const notifications = harness.notifier.entries();
    REQUIRE(notifications.size() == 1);
    CHECK(notifications[0].kind == NotificationKind::Warning);
    CHECK_THAT(notifications[0].message, ContainsSubstring("history not saved"));
}

TEST_CASE("SessionOrchestrator reports a dictation that reached no output", "[pipeline]")
{
    auto harness = Harness {};
    harness.history.fail = true;
    harness.clipboard.failCount = 2;
    auto orchestrator = harness.makeOrchestrator();

    auto const outcome = runSession(orchestrator);
    REQUIRE(outcome.has_value());
    CHECK_FALSE(outcome->clipboardOk);
    CHECK_FALSE(outcome->historyPath.has_value());
    CHECK(harness.state.current() == SessionState::Idle);

    auto const notifications = harness.notifier.entries();
    REQUIRE(notifications.size() == 1);
    CHECK(notifications[0].kind == NotificationKind::Warning);
    CHECK_THAT(notifications[0].message, ContainsSubstring("not delivered"));
}

TEST_CASE("SessionOrchestrator aborts to Idle on hard failures", "[pipeline]")
{
    auto harness = Harness {};
    auto orchestrator = harness.makeOrchestrator({ .refinementEnabled = true });
    auto expectedCode = ErrorCode::Unknown;
    auto expectedTrigger = Trigger::Failed;

    SECTION("capture cannot be finished")
    {
        harness.capture.failFinish = true;
        expectedCode = ErrorCode::Capture;
        expectedTrigger = Trigger::CaptureError;
    }

    SECTION("recording too short")
    {
        harness.capture.seconds = 0.05;
        expectedCode = ErrorCode::InvalidArtifact;
        expectedTrigger = Trigger::CaptureError;
    }

    SECTION("transcription fails")
    {
        harness.transcriber.result = makeError(ErrorCode::ModelNotFound, "Model not found");
        expectedCode = ErrorCode::ModelNotFound;
        expectedTrigger = Trigger::Failed;
    }

    auto const outcome = runSession(orchestrator);
    REQUIRE(!outcome.has_value());
    CHECK(outcome.error().code == expectedCode);

    CHECK(harness.state.current() == SessionState::Idle);
    CHECK(harness.state.history().back().trigger == expectedTrigger);
    CHECK_FALSE(orchestrator.isBusy());
    CHECK(harness.refiner.calls == 0);
    CHECK(harness.clipboard.calls == 0);
    CHECK(harness.history.calls == 0);

    auto const notifications = harness.notifier.entries();
    REQUIRE(notifications.size() == 1);
    CHECK(notifications[0].kind == NotificationKind::Error);
    CHECK_THAT(notifications[0].message, ContainsSubstring("Dictation failed"));

    // The guard is free again.
    harness.capture.failFinish = false;
    harness.capture.seconds = 1.0;
    harness.transcriber.result = TranscriptionResult { .text = "again" };
    auto const retry = runSession(orchestrator);
    REQUIRE(retry.has_value());
    CHECK(retry->finalText == "Hello, world.");
}

TEST_CASE("SessionOrchestrator releases the guard when capture cannot start", "[pipeline]")
{
    auto harness = Harness {};
    harness.capture.failStart = true;
    auto orchestrator = harness.makeOrchestrator();

    auto const started = orchestrator.activate();
    REQUIRE(!started.has_value());
    CHECK(started.error().code == ErrorCode::Capture);
    CHECK(harness.state.current() == SessionState::Idle);
    CHECK(harness.state.history().back().trigger == Trigger::CaptureError);
    CHECK_FALSE(orchestrator.isBusy());
    CHECK(harness.notifier.count(NotificationKind::Error) == 1);

    harness.capture.failStart = false;
    CHECK(runSession(orchestrator).has_value());
}

TEST_CASE("SessionOrchestrator recovers from a capture that throws", "[pipeline]")
{
    auto harness = Harness {};
    auto orchestrator = harness.makeOrchestrator();

    SECTION("while starting")
    {
        harness.capture.throwOnStart = true;
        auto const started = orchestrator.activate();
        REQUIRE(!started.has_value());
        CHECK(started.error().code == ErrorCode::Capture);
        CHECK_THAT(started.error().message, ContainsSubstring("Audio backend crashed"));
    }

    SECTION("while finishing")
    {
        harness.capture.throwOnFinish = true;
        auto const outcome = runSession(orchestrator);
        REQUIRE(!outcome.has_value());
        CHECK(outcome.error().code == ErrorCode::Unknown);
    }

    CHECK(harness.state.current() == SessionState::Idle);
    CHECK_FALSE(orchestrator.isBusy());
    CHECK(harness.notifier.count(NotificationKind::Error) == 1);

    harness.capture.throwOnStart = false;
    harness.capture.throwOnFinish = false;
    CHECK(runSession(orchestrator).has_value());
}

#ifndef _WIN32
TEST_CASE("SessionOrchestrator does not hold the guard for a slow desktop notification", "[pipeline]")
{
    auto harness = Harness {};
    auto runner = SubprocessRunner {};
    auto notifier = DesktopNotifier(&runner, test::writeScript(harness.dir / "notify.sh", "sleep 10"));
    auto orchestrator = SessionOrchestrator(harness.state,
                                            PipelineCollaborators {
                                                .capture = harness.capture,
                                                .transcriber = harness.transcriber,
                                                .refiner = nullptr,
                                                .clipboard = harness.clipboard,
                                                .history = harness.history,
                                                .notifier = notifier,
                                            },
                                            OrchestratorSettings { .clipboardRetryDelay = 1ms });

    auto const started = std::chrono::steady_clock::now();
    REQUIRE(runSession(orchestrator).has_value());
    CHECK(std::chrono::steady_clock::now() - started < 1500ms);

    CHECK_FALSE(orchestrator.isBusy());
    REQUIRE(orchestrator.activate().has_value());
    REQUIRE(orchestrator.deactivate().get().has_value());
    CHECK(std::chrono::steady_clock::now() - started < 1500ms);
}
#endif

TEST_CASE("SessionOrchestrator ignores a Deactivate without a recording", "[pipeline]")
{
    auto harness = Harness {};
    auto orchestrator = harness.makeOrchestrator();

    auto const outcome = orchestrator.deactivate().get();
    REQUIRE(!outcome.has_value());
    CHECK(outcome.error().code == ErrorCode::InvalidArgument);
    CHECK(harness.state.current() == SessionState::Idle);
    CHECK(harness.state.history().empty());
    CHECK(harness.transcriber.calls == 0);
    CHECK(harness.notifier.entries().empty());
}

TEST_CASE("SessionOrchestrator runs at most one session", "[pipeline]")
{
    auto harness = Harness {};
    auto orchestrator = harness.makeOrchestrator();

    SECTION("a second gesture while processing is dropped")
    {
        harness.transcriber.holdUntilReleased();
        REQUIRE(orchestrator.activate().has_value());
        auto pending = orchestrator.deactivate();

        auto const second = orchestrator.activate();
        REQUIRE(!second.has_value());
        CHECK(second.error().code == ErrorCode::Conflict);
        CHECK(orchestrator.isBusy());

        harness.transcriber.release();
        REQUIRE(pending.get().has_value());
        CHECK(harness.capture.starts == 1);
        CHECK(harness.transcriber.calls == 1);
        CHECK_FALSE(orchestrator.isBusy());
    }

    SECTION("concurrent activations start exactly one capture")
    {
        constexpr auto ThreadCount = 16;
        auto accepted = std::atomic<int> { 0 };
        auto rejected = std::atomic<int> { 0 };
        auto start = std::latch { ThreadCount };
        auto threads = std::vector<std::jthread> {};
        for (auto i = 0; i < ThreadCount; ++i)
        {
            threads.emplace_back([&] {
                start.arrive_and_wait();
                if (orchestrator.activate())
                    ++accepted;
                else
                    ++rejected;
            });
        }
        threads.clear();

        CHECK(accepted == 1);
        CHECK(rejected == ThreadCount - 1);
        CHECK(harness.capture.starts == 1);

        REQUIRE(orchestrator.deactivate().get().has_value());
        CHECK(harness.transcriber.calls == 1);
        CHECK(harness.clipboard.calls == 1);
        CHECK(harness.history.calls == 1);
    }

    SECTION("back-to-back sessions")
    {
        for (auto i = 0; i < 3; ++i)
            REQUIRE(runSession(orchestrator).has_value());
        CHECK(harness.capture.starts == 3);
        CHECK(harness.history.calls == 3);
        CHECK(harness.notifier.count(NotificationKind::Success) == 3);
    }
}

TEST_CASE("SessionOrchestrator is Idle whenever the pipeline future is ready", "[pipeline]")
{
    auto harness = Harness {};
    auto orchestrator = harness.makeOrchestrator({ .refinementEnabled = true });

    auto const cases = std::vector<std::function<void()>> {
        [&] { harness.transcriber.result = TranscriptionResult { .text = "ok" }; },
        [&] { harness.transcriber.result = TranscriptionResult { .text = "" }; },
        [&] { harness.transcriber.result = makeError(ErrorCode::DeviceError, "GPU gone"); },
        [&] {
            harness.transcriber.result = TranscriptionResult { .text = "ok" };
            harness.refiner.result = makeError(ErrorCode::ProcessError, "crash");
        },
        [&] {
            harness.clipboard.failCount = harness.clipboard.calls + 2;
            harness.history.fail = true;
        },
    };

    for (auto const& prepare: cases)
    {
        prepare();
        REQUIRE(orchestrator.activate().has_value());
        auto future = orchestrator.deactivate();
        future.wait();
        CHECK(harness.state.current() == SessionState::Idle);
        CHECK_FALSE(orchestrator.isBusy());
        static_cast<void>(future.get());
    }
}
