// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <refine/RefinementAdapter.hpp>
#include <stt/TranscriptionAdapter.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace dictum
{

/// @brief Hotkey configuration section.
struct HotkeyConfig
{
    std::vector<std::string> modifiers = { "Ctrl", "Shift" };
    std::string key = "D";
};

/// @brief Audio configuration section.
struct AudioConfig
{
    std::string deviceName;
    int minDurationMs = 200;
};

/// @brief Output configuration section.
struct OutputConfig
{
    /// @brief Root of recordings and history. Empty means defaultDataDir().
    std::string dataRoot;

    /// @brief History file extension, ".md" or ".txt".
    std::string fileFormat = ".md";

    /// @brief Clipboard program and arguments. Empty means auto-detect (wl-copy or xclip).
    std::vector<std::string> clipboardCommand;

    int clipboardRetryDelayMs = 100;
};

/// @brief Notification configuration section.
struct NotificationConfig
{
    bool desktop = true;
    std::string command = "notify-send";
};

/// @brief Top-level application configuration.
struct AppConfig
{
    HotkeyConfig hotkey;
    TranscriptionConfig transcription;
    RefinementConfig refinement;
    AudioConfig audio;
    OutputConfig output;
    NotificationConfig notifications;
};

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration, defaults if no file exists, or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or ErrorCode::ConfigError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Checks value ranges and required fields.
///
/// Refinement settings beyond the timeout are only checked when refinement is enabled.
/// @return Success or ErrorCode::ConfigError naming the first offending field.
[[nodiscard]] auto validateConfig(const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path.
/// On Linux: $XDG_CONFIG_HOME/dictum or ~/.config/dictum
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default data directory path.
/// On Linux: $XDG_DATA_HOME/dictum or ~/.local/share/dictum
[[nodiscard]] auto defaultDataDir() -> std::string;

/// @brief Returns the configured data root or the default data directory.
[[nodiscard]] auto effectiveDataRoot(const AppConfig& config) -> std::string;

} // namespace dictum
