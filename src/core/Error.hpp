// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace dictum
{

/// @brief Error codes for categorizing failures across the application.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    ProcessError,
    Conflict,
    Capture,
    InvalidArtifact,
    ModelNotFound,
    DeviceError,
    Timeout,
    InvalidInput,
    MalformedOutput,
    EmptyOutput,
    NoSpeech,
    ClipboardLocked,
    HistoryWrite,
    InvalidTransition,
};

/// @brief Returns a stable, human-readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::ProcessError: return "ProcessError";
        case ErrorCode::Conflict: return "Conflict";
        case ErrorCode::Capture: return "Capture";
        case ErrorCode::InvalidArtifact: return "InvalidArtifact";
        case ErrorCode::ModelNotFound: return "ModelNotFound";
        case ErrorCode::DeviceError: return "DeviceError";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::InvalidInput: return "InvalidInput";
        case ErrorCode::MalformedOutput: return "MalformedOutput";
        case ErrorCode::EmptyOutput: return "EmptyOutput";
        case ErrorCode::NoSpeech: return "NoSpeech";
        case ErrorCode::ClipboardLocked: return "ClipboardLocked";
        case ErrorCode::HistoryWrite: return "HistoryWrite";
        case ErrorCode::InvalidTransition: return "InvalidTransition";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
///
/// Subprocess failures additionally carry the backend's exit code and captured stderr.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    std::optional<int> exitCode {};
    std::string stderrText {};
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { .code = code, .message = std::move(message) });
}

/// @brief Creates an unexpected Error describing a failed backend process.
/// @param code The error code.
/// @param message A descriptive error message.
/// @param exitCode The process exit code.
/// @param stderrText The captured standard error output.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeProcessError(ErrorCode code,
                                           std::string message,
                                           int exitCode,
                                           std::string stderrText) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error {
        .code = code, .message = std::move(message), .exitCode = exitCode, .stderrText = std::move(stderrText) });
}

} // namespace dictum

template <>
struct std::formatter<dictum::Error>: std::formatter<std::string>
{
    auto format(const dictum::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", dictum::errorCodeName(error.code), error.message), ctx);
    }
};
