// SPDX-License-Identifier: Apache-2.0
#include "WavFile.hpp"

#include <core/Clock.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <fstream>
#include <string_view>

namespace dictum::wav
{

namespace
{
    constexpr std::uint16_t PcmFormat = 1;
    constexpr std::uint16_t ExpectedChannels = 1;
    constexpr std::uint16_t ExpectedBitsPerSample = 16;
    constexpr std::uintmax_t MinimumFileSize = 44;

    void putU16(std::ofstream& out, std::uint16_t value)
    {
        auto const bytes = std::array { static_cast<char>(value & 0xFF), static_cast<char>((value >> 8) & 0xFF) };
        out.write(bytes.data(), bytes.size());
    }

    void putU32(std::ofstream& out, std::uint32_t value)
    {
        auto const bytes = std::array {
            static_cast<char>(value & 0xFF),
            static_cast<char>((value >> 8) & 0xFF),
            static_cast<char>((value >> 16) & 0xFF),
            static_cast<char>((value >> 24) & 0xFF),
        };
        out.write(bytes.data(), bytes.size());
    }

    /// @brief Little-endian reader over an input stream that remembers the first failure.
    struct Reader
    {
        std::ifstream& in;

        auto tag() -> std::string
        {
            auto buf = std::array<char, 4> {};
            in.read(buf.data(), buf.size());
            return std::string(buf.data(), in ? buf.size() : 0);
        }

        auto u16() -> std::uint16_t
        {
            auto buf = std::array<unsigned char, 2> {};
            in.read(reinterpret_cast<char*>(buf.data()), buf.size());
            return static_cast<std::uint16_t>(buf[0] | (buf[1] << 8));
        }

        auto u32() -> std::uint32_t
        {
            auto buf = std::array<unsigned char, 4> {};
            in.read(reinterpret_cast<char*>(buf.data()), buf.size());
            return static_cast<std::uint32_t>(buf[0]) | (static_cast<std::uint32_t>(buf[1]) << 8)
                   | (static_cast<std::uint32_t>(buf[2]) << 16) | (static_cast<std::uint32_t>(buf[3]) << 24);
        }
    };

    auto invalid(const std::filesystem::path& path, std::string_view reason) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::InvalidArtifact, std::format("{}: {}", path.filename().string(), reason));
    }
} // namespace

auto toPcm16(std::span<const float> samples) -> std::vector<std::int16_t>
{
    auto result = std::vector<std::int16_t> {};
    result.reserve(samples.size());
    for (auto const sample: samples)
    {
        auto const clamped = std::clamp(sample, -1.0f, 1.0f);
        result.push_back(static_cast<std::int16_t>(std::lround(clamped * 32767.0f)));
    }
    return result;
}

auto write(const std::filesystem::path& path, std::span<const std::int16_t> samples) -> VoidResult
{
    auto ec = std::error_code {};
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Cannot create directory {}: {}", path.parent_path().string(), ec.message()));
    }

    auto out = std::ofstream(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot write WAV file {}", path.string()));

    auto const dataBytes = static_cast<std::uint32_t>(samples.size() * sizeof(std::int16_t));
    auto const blockAlign = static_cast<std::uint16_t>(ExpectedChannels * ExpectedBitsPerSample / 8);

    out.write("RIFF", 4);
    putU32(out, 36 + dataBytes);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    putU32(out, 16);
    putU16(out, PcmFormat);
    putU16(out, ExpectedChannels);
    putU32(out, SampleRate);
    putU32(out, SampleRate * blockAlign);
    putU16(out, blockAlign);
    putU16(out, ExpectedBitsPerSample);
    out.write("data", 4);
    putU32(out, dataBytes);
    for (auto const sample: samples)
        putU16(out, static_cast<std::uint16_t>(sample));

    if (!out)
        return makeError(ErrorCode::IoError, std::format("Failed writing WAV file {}", path.string()));
    return {};
}

auto readInfo(const std::filesystem::path& path) -> Result<WavInfo>
{
    auto ec = std::error_code {};
    if (!std::filesystem::is_regular_file(path, ec))
        return invalid(path, "file not found");

    auto const size = std::filesystem::file_size(path, ec);
    if (ec || size < MinimumFileSize)
        return invalid(path, "file too small");

    auto in = std::ifstream(path, std::ios::binary);
    if (!in.is_open())
        return invalid(path, "cannot open file");

    auto reader = Reader { in };
    if (reader.tag() != "RIFF")
        return invalid(path, "expected 'RIFF' header");
    static_cast<void>(reader.u32()); // RIFF size
    if (reader.tag() != "WAVE")
        return invalid(path, "expected 'WAVE' format");

    auto info = WavInfo {};
    auto haveFormat = false;
    while (in)
    {
        auto const chunkId = reader.tag();
        auto const chunkSize = reader.u32();
        if (!in)
            break;

        if (chunkId == "fmt ")
        {
            if (chunkSize < 16)
                return invalid(path, "fmt chunk too small");
            info.audioFormat = reader.u16();
            info.channels = reader.u16();
            info.sampleRate = reader.u32();
            static_cast<void>(reader.u32()); // byte rate
            static_cast<void>(reader.u16()); // block align
            info.bitsPerSample = reader.u16();
            in.seekg(chunkSize - 16 + (chunkSize & 1), std::ios::cur);
            haveFormat = true;
        }
        else if (chunkId == "data")
        {
            if (!haveFormat)
                return invalid(path, "missing 'fmt ' chunk");
            // Recorders that were killed may leave a size larger than the file.
            auto const available = size - static_cast<std::uintmax_t>(in.tellg());
            info.dataBytes = static_cast<std::uint32_t>(std::min<std::uintmax_t>(chunkSize, available));
            return info;
        }
        else
        {
            in.seekg(chunkSize + (chunkSize & 1), std::ios::cur);
        }
    }

    return invalid(path, haveFormat ? "missing 'data' chunk" : "missing 'fmt ' chunk");
}

auto validate(const std::filesystem::path& path, std::chrono::milliseconds minDuration) -> Result<AudioArtifact>
{
    auto info = readInfo(path);
    if (!info)
        return std::unexpected(info.error());

    if (info->audioFormat != PcmFormat)
        return invalid(path, std::format("expected PCM (1), got format {}", info->audioFormat));
    if (info->channels != ExpectedChannels)
        return invalid(path, std::format("expected mono, got {} channels", info->channels));
    if (info->sampleRate != SampleRate)
        return invalid(path, std::format("expected {} Hz, got {} Hz", SampleRate, info->sampleRate));
    if (info->bitsPerSample != ExpectedBitsPerSample)
        return invalid(path, std::format("expected 16 bit, got {} bit", info->bitsPerSample));

    auto const duration = info->durationSeconds();
    if (duration * 1000.0 < static_cast<double>(minDuration.count()))
        return invalid(path, std::format("recording too short ({:.2f}s)", duration));

    log::debug("Validated WAV {} ({:.2f}s)", path.string(), duration);
    return AudioArtifact { .path = path, .durationSeconds = duration };
}

auto moveToFailedDirectory(const std::filesystem::path& path) -> Result<std::filesystem::path>
{
    auto ec = std::error_code {};
    auto const failedDir = path.parent_path() / "failed";
    std::filesystem::create_directories(failedDir, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Cannot create {}: {}", failedDir.string(), ec.message()));

    auto target = failedDir / path.filename();
    if (std::filesystem::exists(target, ec))
        target = failedDir
                 / std::format("{}_{}{}",
                               path.stem().string(),
                               compactTimestamp(std::chrono::system_clock::now()),
                               path.extension().string());

    std::filesystem::rename(path, target, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Cannot move {} to {}: {}", path.string(), target.string(), ec.message()));

    log::warning("Moved invalid recording to {}", target.string());
    return target;
}

auto validateOrQuarantine(const std::filesystem::path& path, std::chrono::milliseconds minDuration)
    -> Result<AudioArtifact>
{
    auto artifact = validate(path, minDuration);
    if (artifact)
        return artifact;

    log::warning("Invalid recording: {}", artifact.error().message);
    auto ec = std::error_code {};
    if (std::filesystem::exists(path, ec))
    {
        if (auto moved = moveToFailedDirectory(path); !moved)
            log::error("{}", moved.error().message);
    }
    return artifact;
}

} // namespace dictum::wav
