// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/FileCapture.hpp>
#include <audio/MicrophoneCapture.hpp>
#include <core/Log.hpp>
#include <hotkey/Chord.hpp>
#include <hotkey/HotkeyCorrelator.hpp>
#include <hotkey/HotkeyRegistry.hpp>
#include <hotkey/TerminalKeySource.hpp>
#include <output/ClipboardSink.hpp>
#include <output/HistorySink.hpp>
#include <output/Notifier.hpp>
#include <pipeline/SessionOrchestrator.hpp>
#include <process/ProcessRunner.hpp>
#include <refine/Glossary.hpp>
#include <refine/RefinementAdapter.hpp>
#include <session/SessionStateMachine.hpp>
#include <stt/TranscriptionAdapter.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <format>
#include <future>
#include <mutex>
#include <print>
#include <thread>
#include <vector>

namespace dictum
{

namespace
{
    constexpr auto KeyPollTimeoutMs = 50;

    auto isQuitKey(const KeyEvent& event) -> bool
    {
        if (event.type != KeyEventType::Press)
            return false;
        if (event.key == KeyCode::Escape && event.modifiers == Modifier::None)
            return true;
        return event.key == static_cast<KeyCode>(U'c') && event.modifiers == Modifier::Ctrl;
    }
} // namespace

struct App::Impl
{
    AppConfig config;
    SubprocessRunner runner;
    SessionStateMachine state;

    std::unique_ptr<CaptureSource> capture;
    std::unique_ptr<TranscriptionAdapter> transcriber;
    std::unique_ptr<RefinementAdapter> refiner;
    std::unique_ptr<CommandClipboard> clipboard;
    std::unique_ptr<MarkdownHistoryWriter> history;
    std::unique_ptr<DesktopNotifier> notifier;
    std::unique_ptr<SessionOrchestrator> orchestrator;

    // Hotkey signals are handed from the keyboard path to the dispatcher thread.
    std::mutex queueMutex;
    std::condition_variable queueCondition;
    std::deque<HotkeySignal> signalQueue;
    bool stopping = false;
    std::vector<std::future<Result<PipelineOutcome>>> pending;

    explicit Impl(AppConfig cfg): config(std::move(cfg)) {}

    void enqueue(HotkeySignal signal)
    {
        {
            auto const lock = std::lock_guard(queueMutex);
            signalQueue.push_back(signal);
        }
        queueCondition.notify_one();
    }

    /// @brief Reports and drops pipeline futures that have completed.
    void reapFinished()
    {
        std::erase_if(pending, [](std::future<Result<PipelineOutcome>>& future) {
            if (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
                return false;
            auto const outcome = future.get();
            if (outcome)
                log::debug("Pipeline finished, history: {}",
                           outcome->historyPath ? outcome->historyPath->string() : std::string("-"));
            else
                log::debug("Pipeline ended: {}", outcome.error());
            return true;
        });
    }

    void dispatchLoop()
    {
        while (true)
        {
            auto signal = HotkeySignal::Activate;
            {
                auto lock = std::unique_lock(queueMutex);
                queueCondition.wait(lock, [this] { return stopping || !signalQueue.empty(); });
                if (signalQueue.empty())
                    break;
                signal = signalQueue.front();
                signalQueue.pop_front();
            }

            log::debug("Hotkey signal: {}", hotkeySignalName(signal));
            reapFinished();
            switch (signal)
            {
                case HotkeySignal::Activate:
                    if (auto const started = orchestrator->activate(); !started)
                        log::debug("Activate not accepted: {}", started.error());
                    break;
                case HotkeySignal::Deactivate: pending.push_back(orchestrator->deactivate()); break;
            }
        }

        // A recording still open at shutdown is finished so that its guard is released.
        if (state.current() == SessionState::Recording)
            pending.push_back(orchestrator->deactivate());
        for (auto& future: pending)
            future.wait();
        reapFinished();
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App() = default;

auto App::initialize(std::filesystem::path inputFile) -> VoidResult
{
    auto& impl = *_impl;
    auto const& config = impl.config;

    if (auto const valid = validateConfig(config); !valid)
        return valid;

    auto const dataRoot = std::filesystem::path(effectiveDataRoot(config));
    auto const minDuration = std::chrono::milliseconds(config.audio.minDurationMs);
    log::info("Data root: {}", dataRoot.string());

    if (inputFile.empty())
        impl.capture = std::make_unique<MicrophoneCapture>(dataRoot / "tmp", config.audio.deviceName, minDuration);
    else
        impl.capture = std::make_unique<FileCapture>(std::move(inputFile), minDuration);

    impl.transcriber = std::make_unique<TranscriptionAdapter>(config.transcription, impl.runner);

    auto glossary = Glossary {};
    if (config.refinement.enabled)
    {
        impl.refiner = std::make_unique<RefinementAdapter>(config.refinement, impl.runner);
        if (config.refinement.useGlossary)
            glossary = loadGlossary(config.refinement.glossaryPath);
    }

    auto clipboardCommand = config.output.clipboardCommand;
    if (clipboardCommand.empty())
        clipboardCommand = CommandClipboard::detectCommand();
    impl.clipboard = std::make_unique<CommandClipboard>(std::move(clipboardCommand), impl.runner);
    impl.history = std::make_unique<MarkdownHistoryWriter>(dataRoot, config.output.fileFormat);
    impl.notifier = std::make_unique<DesktopNotifier>(config.notifications.desktop ? &impl.runner : nullptr,
                                                      config.notifications.command);

    impl.orchestrator = std::make_unique<SessionOrchestrator>(
        impl.state,
        PipelineCollaborators {
            .capture = *impl.capture,
            .transcriber = *impl.transcriber,
            .refiner = impl.refiner.get(),
            .clipboard = *impl.clipboard,
            .history = *impl.history,
            .notifier = *impl.notifier,
        },
        OrchestratorSettings {
            .refinementEnabled = config.refinement.enabled,
            .language = config.transcription.language,
            .sttModel = std::filesystem::path(config.transcription.modelPath).filename().string(),
            .glossary = std::move(glossary),
            .clipboardRetryDelay = std::chrono::milliseconds(config.output.clipboardRetryDelayMs),
        });

    return {};
}

auto App::run() -> int
{
    auto& impl = *_impl;

    auto chord = makeChord(impl.config.hotkey.modifiers, impl.config.hotkey.key);
    if (!chord)
    {
        log::error("Invalid hotkey: {}", chord.error());
        return 1;
    }

    auto keys = TerminalKeySource {};
    if (auto const terminal = keys.initialize(); !terminal)
    {
        log::error("Cannot read the keyboard: {}", terminal.error());
        return 1;
    }

    auto registry = LockFileRegistry(LockFileRegistry::defaultDirectory());
    auto correlator = HotkeyCorrelator([&impl](HotkeySignal signal) { impl.enqueue(signal); });
    if (auto const registered = correlator.registerChord(*chord, registry); !registered)
        impl.notifier->notify(std::format("Hotkey {} unavailable: {}", formatChord(*chord), registered.error().message),
                              NotificationKind::Warning);
    else
        log::info("Hold {} to dictate, Escape or Ctrl+C to quit", formatChord(*chord));

    auto dispatcher = std::thread([&impl] { impl.dispatchLoop(); });

    auto quit = false;
    while (!quit && !keys.closed())
    {
        for (auto const& event: keys.poll(KeyPollTimeoutMs))
        {
            if (isQuitKey(event))
            {
                quit = true;
                break;
            }
            correlator.feed(event);
        }
    }

    correlator.unregister();
    {
        auto const lock = std::lock_guard(impl.queueMutex);
        impl.stopping = true;
    }
    impl.queueCondition.notify_one();
    dispatcher.join();
    keys.shutdown();
    return 0;
}

auto App::runOnce() -> int
{
    auto& impl = *_impl;

    if (auto const started = impl.orchestrator->activate(); !started)
    {
        log::error("Could not start the session: {}", started.error());
        return 1;
    }

    auto const outcome = impl.orchestrator->deactivate().get();
    if (!outcome)
    {
        if (outcome.error().code == ErrorCode::NoSpeech)
            return 0;
        log::error("Dictation failed: {}", outcome.error());
        return 1;
    }

    std::println("{}", outcome->finalText);
    return 0;
}

} // namespace dictum
