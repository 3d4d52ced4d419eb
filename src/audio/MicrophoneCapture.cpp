// SPDX-License-Identifier: Apache-2.0

#include "MicrophoneCapture.hpp"

#include <audio/WavFile.hpp>
#include <core/Clock.hpp>
#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <format>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace dictum
{

struct MicrophoneCapture::Impl
{
    std::filesystem::path recordingDir;
    std::string deviceName;
    std::chrono::milliseconds minDuration {};

    ma_context context {};
    ma_device device {};
    bool contextInitialized = false;
    bool deviceInitialized = false;
    bool capturing = false;

    std::mutex bufferMutex;
    std::vector<float> buffer;
    std::atomic<float> peakLevel { 0.0f };
    std::uint64_t nextId = 1;
    std::uint64_t activeId = 0;

    auto openDevice() -> VoidResult;
};

namespace
{

    void audioDataCallback(ma_device* device, void* /*output*/, const void* input, ma_uint32 frameCount)
    {
        auto* impl = static_cast<MicrophoneCapture::Impl*>(device->pUserData);
        if (!impl || !input)
            return;

        auto const samples = std::span<const float>(static_cast<const float*>(input), frameCount);

        auto peak = 0.0f;
        for (auto const sample: samples)
            peak = std::max(peak, std::abs(sample));
        impl->peakLevel.store(peak, std::memory_order_relaxed);

        auto lock = std::lock_guard(impl->bufferMutex);
        impl->buffer.insert(impl->buffer.end(), samples.begin(), samples.end());
    }

    auto lowercase(std::string text) -> std::string
    {
        std::ranges::transform(text, text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

} // namespace

auto MicrophoneCapture::Impl::openDevice() -> VoidResult
{
    auto const ctxResult = ma_context_init(nullptr, 0, nullptr, &context);
    if (ctxResult != MA_SUCCESS)
        return makeError(ErrorCode::Capture,
                         std::format("Failed to initialize audio context: {}", static_cast<int>(ctxResult)));
    contextInitialized = true;

    ma_device_info* captureDevices = nullptr;
    auto captureCount = ma_uint32 { 0 };
    auto const enumResult = ma_context_get_devices(&context, nullptr, nullptr, &captureDevices, &captureCount);

    auto matchedDeviceId = std::optional<ma_device_id> {};
    if (enumResult == MA_SUCCESS)
    {
        for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            log::debug("Capture device [{}] {}", i, captureDevices[i].name);

        if (!deviceName.empty())
        {
            auto const target = lowercase(deviceName);
            for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            {
                if (lowercase(captureDevices[i].name).find(target) != std::string::npos)
                {
                    matchedDeviceId = captureDevices[i].id;
                    break;
                }
            }
            if (!matchedDeviceId)
                log::warning("No capture device matching '{}', falling back to auto-select", deviceName);
        }

        // Monitor sources are loopbacks, not microphones.
        if (!matchedDeviceId)
        {
            for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            {
                if (!lowercase(captureDevices[i].name).starts_with("monitor"))
                {
                    matchedDeviceId = captureDevices[i].id;
                    break;
                }
            }
        }
    }
    else
    {
        log::warning("Failed to enumerate capture devices (code: {}), using default", static_cast<int>(enumResult));
    }

    auto deviceConfig = ma_device_config_init(ma_device_type_capture);
    deviceConfig.capture.format = ma_format_f32;
    deviceConfig.capture.channels = 1;
    deviceConfig.sampleRate = wav::SampleRate;
    deviceConfig.dataCallback = audioDataCallback;
    deviceConfig.pUserData = this;
    if (matchedDeviceId)
        deviceConfig.capture.pDeviceID = &*matchedDeviceId;

    auto const result = ma_device_init(&context, &deviceConfig, &device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::Capture,
                         std::format("Failed to initialize audio device: {}", static_cast<int>(result)));

    deviceInitialized = true;
    log::info("Audio capture device: {} (16kHz, mono)", device.capture.name);
    return {};
}

MicrophoneCapture::MicrophoneCapture(std::filesystem::path recordingDir,
                                     std::string deviceName,
                                     std::chrono::milliseconds minDuration):
    _impl(std::make_unique<Impl>())
{
    _impl->recordingDir = std::move(recordingDir);
    _impl->deviceName = std::move(deviceName);
    _impl->minDuration = minDuration;
}

MicrophoneCapture::~MicrophoneCapture()
{
    if (_impl->capturing)
        ma_device_stop(&_impl->device);
    if (_impl->deviceInitialized)
        ma_device_uninit(&_impl->device);
    if (_impl->contextInitialized)
        ma_context_uninit(&_impl->context);
}

auto MicrophoneCapture::startCapture() -> Result<CaptureHandle>
{
    if (_impl->capturing)
        return makeError(ErrorCode::Capture, "A capture is already running");

    if (!_impl->deviceInitialized)
    {
        if (auto opened = _impl->openDevice(); !opened)
            return std::unexpected(opened.error());
    }

    {
        auto lock = std::lock_guard(_impl->bufferMutex);
        _impl->buffer.clear();
    }

    auto const result = ma_device_start(&_impl->device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::Capture, std::format("Failed to start audio capture: {}", static_cast<int>(result)));

    _impl->capturing = true;
    _impl->activeId = _impl->nextId++;

    auto handle = CaptureHandle {
        .id = _impl->activeId,
        .path = _impl->recordingDir
                / std::format("rec_{}.wav", compactTimestamp(std::chrono::system_clock::now())),
        .startedAt = std::chrono::steady_clock::now(),
    };
    log::info("Recording started ({})", handle.path.filename().string());
    return handle;
}

auto MicrophoneCapture::finishCapture(const CaptureHandle& handle) -> Result<AudioArtifact>
{
    if (!_impl->capturing || handle.id != _impl->activeId)
        return makeError(ErrorCode::Capture, "No matching capture is running");

    ma_device_stop(&_impl->device);
    _impl->capturing = false;
    _impl->peakLevel.store(0.0f, std::memory_order_relaxed);

    auto samples = std::vector<float> {};
    {
        auto lock = std::lock_guard(_impl->bufferMutex);
        samples = std::move(_impl->buffer);
        _impl->buffer.clear();
    }

    auto written = wav::write(handle.path, wav::toPcm16(samples));
    if (!written)
        return makeError(ErrorCode::Capture, written.error().message);

    auto const seconds = static_cast<double>(samples.size()) / wav::SampleRate;
    log::info("Recording stopped: {:.2f}s, {} samples", seconds, samples.size());
    return AudioArtifact { .path = handle.path, .durationSeconds = seconds };
}

auto MicrophoneCapture::validate(const AudioArtifact& artifact) -> Result<AudioArtifact>
{
    return wav::validateOrQuarantine(artifact.path, _impl->minDuration);
}

auto MicrophoneCapture::peakLevel() const -> float
{
    return _impl->peakLevel.load(std::memory_order_relaxed);
}

} // namespace dictum
