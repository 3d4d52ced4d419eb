// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <dictum/Config.hpp>

#include <filesystem>
#include <memory>

namespace dictum
{

/// @brief Wires configuration, backends, outputs and the hotkey feed into one running program.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Validates the configuration and creates all components.
    /// @param inputFile If set, sessions read this WAV file instead of the microphone.
    /// @return Success or an error.
    [[nodiscard]] auto initialize(std::filesystem::path inputFile = {}) -> VoidResult;

    /// @brief Waits for hotkey gestures on the terminal until Ctrl+C or Escape.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

    /// @brief Runs a single session on the input file given to initialize() and prints the result.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto runOnce() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace dictum
