// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/CaptureSource.hpp>
#include <core/Clock.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <output/ClipboardSink.hpp>
#include <output/HistorySink.hpp>
#include <output/Notifier.hpp>
#include <refine/Refiner.hpp>
#include <session/SessionStateMachine.hpp>
#include <stt/Transcriber.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <semaphore>
#include <string>
#include <string_view>

namespace dictum
{

/// @brief The components a session drives. All references must outlive the orchestrator.
struct PipelineCollaborators
{
    CaptureSource& capture;
    Transcriber& transcriber;
    Refiner* refiner = nullptr; ///< nullptr if refinement is not available.
    ClipboardSink& clipboard;
    HistorySink& history;
    Notifier& notifier;
};

struct OrchestratorSettings
{
    bool refinementEnabled = false;
    std::string language;  ///< Passed to the transcriber; empty uses its default.
    std::string sttModel;  ///< Recorded in history metadata.
    Glossary glossary;     ///< Read-only after construction.
    std::chrono::milliseconds clipboardRetryDelay { 100 };
};

/// @brief Runs dictation sessions: capture, transcription, optional refinement, clipboard and history.
///
/// At most one session is in flight. The single-flight guard is taken by activate() and released
/// when the pipeline started by deactivate() returns, on every path. A gesture arriving while a
/// session is in flight is dropped. Whatever fails, the state machine is back at Idle before the
/// pipeline's future becomes ready.
///
/// Failure handling per stage:
///   capture, artifact validation, transcription  abort to Idle, Error notification
///   empty transcription                          abort to Idle, Warning notification
///   refinement                                   original text is used
///   clipboard (one retry), history               recorded, the other output is still attempted
class SessionOrchestrator
{
  public:
    SessionOrchestrator(SessionStateMachine& state, PipelineCollaborators collaborators, OrchestratorSettings settings);

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    /// @brief Starts a session: takes the guard, enters Recording and starts the capture.
    /// @return ErrorCode::Conflict if a session is already in flight, or the capture error.
    [[nodiscard]] auto activate() -> VoidResult;

    /// @brief Ends the recording and runs the rest of the pipeline on a background thread.
    ///
    /// Never blocks on the pipeline. Without a recording session the call is ignored and the
    /// returned future holds ErrorCode::InvalidArgument.
    /// @return The outcome, or the terminal error (ErrorCode::NoSpeech for an empty transcript).
    [[nodiscard]] auto deactivate() -> std::future<Result<PipelineOutcome>>;

    /// @brief True while a session holds the single-flight guard.
    [[nodiscard]] auto isBusy() const -> bool;

    [[nodiscard]] auto settings() const noexcept -> const OrchestratorSettings& { return _settings; }

  private:
    struct Session
    {
        std::uint64_t id = 0;
        CaptureHandle handle;
        SystemTime startedAt {};
    };

    auto runPipeline(Session session) -> Result<PipelineOutcome>;
    auto runStages(const Session& session) -> Result<PipelineOutcome>;
    auto failSession(const Session& session, Trigger trigger, std::string_view stage, Error error)
        -> std::unexpected<Error>;
    auto writeClipboard(std::string_view text) -> bool;
    void returnToIdle(Trigger trigger);

    SessionStateMachine& _state;
    PipelineCollaborators _collaborators;
    OrchestratorSettings _settings;

    std::binary_semaphore _guard { 1 };
    std::atomic<bool> _busy { false };
    mutable std::mutex _mutex;
    std::optional<Session> _recording;
    std::uint64_t _nextSessionId = 1;
};

} // namespace dictum
