// SPDX-License-Identifier: Apache-2.0
#include "SessionOrchestrator.hpp"

#include <core/Log.hpp>

#include <exception>
#include <format>
#include <system_error>
#include <thread>
#include <vector>

namespace dictum
{

namespace
{
    auto joinIssues(const std::vector<std::string>& issues) -> std::string
    {
        auto text = std::string {};
        for (auto const& issue: issues)
        {
            if (!text.empty())
                text += ", ";
            text += issue;
        }
        return text;
    }
} // namespace

SessionOrchestrator::SessionOrchestrator(SessionStateMachine& state,
                                         PipelineCollaborators collaborators,
                                         OrchestratorSettings settings):
    _state(state), _collaborators(collaborators), _settings(std::move(settings))
{
}

auto SessionOrchestrator::isBusy() const -> bool
{
    return _busy.load();
}

auto SessionOrchestrator::activate() -> VoidResult
{
    if (!_guard.try_acquire())
    {
        log::warning("Session already in flight, gesture dropped");
        return makeError(ErrorCode::Conflict, "A dictation session is already in flight");
    }
    _busy = true;

    // Undoes the activation on every early exit, exceptions included.
    struct Rollback
    {
        SessionOrchestrator& owner;
        bool armed = true;
        ~Rollback()
        {
            if (!armed)
                return;
            owner.returnToIdle(Trigger::CaptureError);
            owner._busy = false;
            owner._guard.release();
        }
    };
    auto rollback = Rollback { *this };

    if (auto const entered = _state.transition(SessionState::Recording, Trigger::Activate); !entered)
        return std::unexpected(entered.error());

    auto handle = Result<CaptureHandle> {};
    try
    {
        handle = _collaborators.capture.startCapture();
    }
    catch (const std::exception& e)
    {
        handle = makeError(ErrorCode::Capture, e.what());
    }

    if (!handle)
    {
        log::error("Capture could not start: {}", handle.error());
        returnToIdle(Trigger::CaptureError);
        _collaborators.notifier.notify(std::format("Recording failed: {}", handle.error().message),
                                       NotificationKind::Error);
        return std::unexpected(handle.error());
    }

    auto const lock = std::lock_guard(_mutex);
    _recording = Session {
        .id = _nextSessionId++,
        .handle = std::move(*handle),
        .startedAt = std::chrono::system_clock::now(),
    };
    rollback.armed = false;
    log::info("Session {} recording to {}", _recording->id, _recording->handle.path.string());
    return {};
}

auto SessionOrchestrator::deactivate() -> std::future<Result<PipelineOutcome>>
{
    auto const readyFuture = [](Result<PipelineOutcome> result) {
        auto promise = std::promise<Result<PipelineOutcome>> {};
        promise.set_value(std::move(result));
        return promise.get_future();
    };

    auto session = std::optional<Session> {};
    {
        auto const lock = std::lock_guard(_mutex);
        session.swap(_recording);
    }

    if (!session)
    {
        log::debug("Deactivate without a recording session ignored");
        return readyFuture(makeError(ErrorCode::InvalidArgument, "No recording session"));
    }

    if (auto const entered = _state.transition(SessionState::Processing, Trigger::Deactivate); !entered)
    {
        // The state machine already logged the defect; run the pipeline anyway so the guard is released.
        log::error("Session {} continues despite rejected transition", session->id);
    }

    auto const sessionId = session->id;
    try
    {
        return std::async(std::launch::async, [this, session = std::move(*session)]() mutable {
            return runPipeline(std::move(session));
        });
    }
    catch (const std::system_error& e)
    {
        log::error("Session {} pipeline thread could not start: {}", sessionId, e.what());
        returnToIdle(Trigger::Failed);
        _collaborators.notifier.notify(std::format("Dictation failed: {}", e.what()), NotificationKind::Error);
        _busy = false;
        _guard.release();
        return readyFuture(makeError(ErrorCode::Unknown, e.what()));
    }
}

auto SessionOrchestrator::runPipeline(Session session) -> Result<PipelineOutcome>
{
    struct Lease
    {
        SessionOrchestrator& owner;
        ~Lease()
        {
            owner.returnToIdle(Trigger::Failed);
            owner._busy = false;
            owner._guard.release();
        }
    };
    auto const lease = Lease { *this };

    auto const started = std::chrono::steady_clock::now();
    try
    {
        auto outcome = runStages(session);
        log::info("Session {} finished in {}ms",
                  session.id,
                  std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started)
                      .count());
        return outcome;
    }
    catch (const std::exception& e)
    {
        return failSession(
            session, Trigger::Failed, "pipeline", Error { .code = ErrorCode::Unknown, .message = e.what() });
    }
}

auto SessionOrchestrator::runStages(const Session& session) -> Result<PipelineOutcome>
{
    // Capture
    auto artifact = _collaborators.capture.finishCapture(session.handle);
    if (!artifact)
        return failSession(session, Trigger::CaptureError, "capture", std::move(artifact.error()));

    auto validated = _collaborators.capture.validate(*artifact);
    if (!validated)
        return failSession(
            session, Trigger::CaptureError, "artifact validation", std::move(validated.error()));
    log::info("Session {} artifact {} ({:.2f}s)", session.id, validated->path.string(), validated->durationSeconds);

    // Transcription
    auto transcription = _collaborators.transcriber.transcribe(
        TranscriptionRequest { .artifactPath = validated->path, .language = _settings.language });
    if (!transcription)
        return failSession(session, Trigger::Failed, "transcription", std::move(transcription.error()));

    if (transcription->isEmpty())
    {
        log::info("Session {} transcription is empty", session.id);
        returnToIdle(Trigger::Completed);
        _collaborators.notifier.notify("No speech detected", NotificationKind::Warning);
        return makeError(ErrorCode::NoSpeech, "No speech detected");
    }

    auto outcome = PipelineOutcome { .finalText = transcription->text };
    auto issues = std::vector<std::string> {};

    // Refinement
    if (_settings.refinementEnabled && _collaborators.refiner)
    {
        if (auto const entered = _state.transition(SessionState::PostProcessing, Trigger::RefinementStarted);
            !entered)
            log::error("Session {} refines outside PostProcessing", session.id);

        auto refined = _collaborators.refiner->refine(
            RefinementRequest { .text = transcription->text, .glossary = _settings.glossary });
        if (!refined)
        {
            log::warning("Session {} refinement failed, keeping the transcript: {}", session.id, refined.error());
            issues.emplace_back("refinement failed, original text used");
        }
        else if (!refined->succeeded)
        {
            log::warning("Session {} refinement returned no result, keeping the transcript", session.id);
            issues.emplace_back("refinement failed, original text used");
        }
        else
        {
            outcome.finalText = std::move(refined->text);
            outcome.postProcessed = true;
        }
    }

    // Clipboard and history are independent of each other.
    outcome.clipboardOk = writeClipboard(outcome.finalText);
    if (!outcome.clipboardOk)
        issues.emplace_back("clipboard unavailable");

    auto const metadata = HistoryMetadata {
        .created = session.startedAt,
        .language = transcription->language.empty() ? _settings.language : transcription->language,
        .sttModel = _settings.sttModel,
        .durationSeconds =
            transcription->durationSeconds > 0.0 ? transcription->durationSeconds : validated->durationSeconds,
        .postProcessed = outcome.postProcessed,
    };
    if (auto path = _collaborators.history.write(outcome.finalText, metadata))
        outcome.historyPath = std::move(*path);
    else
    {
        log::warning("Session {} history write failed: {}", session.id, path.error());
        issues.emplace_back("history not saved");
    }

    // Completion
    returnToIdle(Trigger::Completed);

    auto const target = outcome.clipboardOk ? "Copied to clipboard" : "Dictation saved";
    if (!outcome.clipboardOk && !outcome.historyPath)
        _collaborators.notifier.notify(std::format("Dictation finished but not delivered ({})", joinIssues(issues)),
                                       NotificationKind::Warning);
    else if (issues.empty())
        _collaborators.notifier.notify(std::format("{} ({} chars)", target, outcome.finalText.size()),
                                       NotificationKind::Success);
    else
        _collaborators.notifier.notify(std::format("{} ({})", target, joinIssues(issues)), NotificationKind::Warning);

    log::info("Session {} delivered: post-processed {}, clipboard {}, history {}",
              session.id,
              outcome.postProcessed,
              outcome.clipboardOk,
              outcome.historyPath ? outcome.historyPath->string() : std::string("-"));
    log::trace("Session {} final text: {}", session.id, outcome.finalText);
    return outcome;
}

auto SessionOrchestrator::failSession(const Session& session,
                                      Trigger trigger,
                                      std::string_view stage,
                                      Error error) -> std::unexpected<Error>
{
    log::error("Session {} aborted in {}: {}", session.id, stage, error);
    if (!error.stderrText.empty())
        log::debug("Session {} backend stderr: {}", session.id, error.stderrText);

    returnToIdle(trigger);
    _collaborators.notifier.notify(std::format("Dictation failed in {}: {}", stage, error.message),
                                   NotificationKind::Error);
    return std::unexpected(std::move(error));
}

auto SessionOrchestrator::writeClipboard(std::string_view text) -> bool
{
    auto written = _collaborators.clipboard.write(text);
    if (written)
        return true;

    log::warning("Clipboard write failed, retrying in {}ms: {}", _settings.clipboardRetryDelay.count(), written.error());
    std::this_thread::sleep_for(_settings.clipboardRetryDelay);

    written = _collaborators.clipboard.write(text);
    if (written)
        return true;

    log::warning("Clipboard write failed again: {}", written.error());
    return false;
}

void SessionOrchestrator::returnToIdle(Trigger trigger)
{
    if (_state.current() == SessionState::Idle)
        return;
    if (auto const idle = _state.transition(SessionState::Idle, trigger); !idle)
        log::error("Could not return to Idle: {}", idle.error());
}

} // namespace dictum
