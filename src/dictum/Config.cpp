// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <hotkey/Chord.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace dictum
{

namespace
{

    auto toJsonArray(const std::vector<std::string>& values) -> nlohmann::json
    {
        auto array = nlohmann::json::array();
        for (auto const& value: values)
            array.push_back(value);
        return array;
    }

    auto configError(std::string_view field, std::string_view problem) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::ConfigError, std::format("Invalid config value '{}': {}", field, problem));
    }

} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/dictum";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/dictum";
    return ".";
}

auto defaultDataDir() -> std::string
{
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData && *xdgData)
        return std::string(xdgData) + "/dictum";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/dictum";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto effectiveDataRoot(const AppConfig& config) -> std::string
{
    return config.output.dataRoot.empty() ? defaultDataDir() : config.output.dataRoot;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content, ErrorCode::ConfigError);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} is not a JSON object", path));

    auto config = AppConfig {};

    // Hotkey section
    if (root.contains("hotkey"))
    {
        auto const& hotkey = root["hotkey"];
        config.hotkey.modifiers = json::getStringArrayOr(hotkey, "modifiers", config.hotkey.modifiers);
        config.hotkey.key = json::getStringOr(hotkey, "key", config.hotkey.key);
    }

    // Transcription section
    if (root.contains("transcription"))
    {
        auto const& stt = root["transcription"];
        auto& target = config.transcription;
        target.cliPath = json::getStringOr(stt, "cliPath", target.cliPath);
        target.modelPath = json::getStringOr(stt, "modelPath", target.modelPath);
        target.language = json::getStringOr(stt, "language", target.language);
        target.timeout = std::chrono::seconds(
            json::getIntOr(stt, "timeoutSeconds", static_cast<int>(target.timeout.count())));
    }

    // Refinement section
    if (root.contains("refinement"))
    {
        auto const& llm = root["refinement"];
        auto& target = config.refinement;
        target.enabled = json::getBoolOr(llm, "enabled", target.enabled);
        target.cliPath = json::getStringOr(llm, "cliPath", target.cliPath);
        target.modelPath = json::getStringOr(llm, "modelPath", target.modelPath);
        target.timeout = std::chrono::seconds(
            json::getIntOr(llm, "timeoutSeconds", static_cast<int>(target.timeout.count())));
        target.gpuAcceleration = json::getBoolOr(llm, "gpuAcceleration", target.gpuAcceleration);
        target.useGlossary = json::getBoolOr(llm, "useGlossary", target.useGlossary);
        target.glossaryPath = json::getStringOr(llm, "glossaryPath", target.glossaryPath);
        target.temperature = json::getDoubleOr(llm, "temperature", target.temperature);
        target.topP = json::getDoubleOr(llm, "topP", target.topP);
        target.repeatPenalty = json::getDoubleOr(llm, "repeatPenalty", target.repeatPenalty);
        target.maxTokens = json::getIntOr(llm, "maxTokens", target.maxTokens);
        target.gpuFailurePatterns = json::getStringArrayOr(llm, "gpuFailurePatterns", target.gpuFailurePatterns);
        target.preamblePatterns = json::getStringArrayOr(llm, "preamblePatterns", target.preamblePatterns);
    }

    // Audio section
    if (root.contains("audio"))
    {
        auto const& audio = root["audio"];
        config.audio.deviceName = json::getStringOr(audio, "deviceName", "");
        config.audio.minDurationMs = json::getIntOr(audio, "minDurationMs", config.audio.minDurationMs);
    }

    // Output section
    if (root.contains("output"))
    {
        auto const& output = root["output"];
        config.output.dataRoot = json::getStringOr(output, "dataRoot", "");
        config.output.fileFormat = json::getStringOr(output, "fileFormat", config.output.fileFormat);
        config.output.clipboardCommand = json::getStringArrayOr(output, "clipboardCommand", {});
        config.output.clipboardRetryDelayMs =
            json::getIntOr(output, "clipboardRetryDelayMs", config.output.clipboardRetryDelayMs);
    }

    // Notifications section
    if (root.contains("notifications"))
    {
        auto const& notifications = root["notifications"];
        config.notifications.desktop = json::getBoolOr(notifications, "desktop", config.notifications.desktop);
        config.notifications.command = json::getStringOr(notifications, "command", config.notifications.command);
    }

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    auto hotkey = nlohmann::json::object();
    hotkey["modifiers"] = toJsonArray(config.hotkey.modifiers);
    hotkey["key"] = config.hotkey.key;
    root["hotkey"] = std::move(hotkey);

    auto stt = nlohmann::json::object();
    stt["cliPath"] = config.transcription.cliPath;
    if (!config.transcription.modelPath.empty())
        stt["modelPath"] = config.transcription.modelPath;
    stt["language"] = config.transcription.language;
    stt["timeoutSeconds"] = config.transcription.timeout.count();
    root["transcription"] = std::move(stt);

    auto llm = nlohmann::json::object();
    llm["enabled"] = config.refinement.enabled;
    llm["cliPath"] = config.refinement.cliPath;
    if (!config.refinement.modelPath.empty())
        llm["modelPath"] = config.refinement.modelPath;
    llm["timeoutSeconds"] = config.refinement.timeout.count();
    llm["gpuAcceleration"] = config.refinement.gpuAcceleration;
    llm["useGlossary"] = config.refinement.useGlossary;
    if (!config.refinement.glossaryPath.empty())
        llm["glossaryPath"] = config.refinement.glossaryPath;
    llm["temperature"] = config.refinement.temperature;
    llm["topP"] = config.refinement.topP;
    llm["repeatPenalty"] = config.refinement.repeatPenalty;
    llm["maxTokens"] = config.refinement.maxTokens;
    llm["gpuFailurePatterns"] = toJsonArray(config.refinement.gpuFailurePatterns);
    llm["preamblePatterns"] = toJsonArray(config.refinement.preamblePatterns);
    root["refinement"] = std::move(llm);

    auto audio = nlohmann::json::object();
    if (!config.audio.deviceName.empty())
        audio["deviceName"] = config.audio.deviceName;
    audio["minDurationMs"] = config.audio.minDurationMs;
    root["audio"] = std::move(audio);

    auto output = nlohmann::json::object();
    if (!config.output.dataRoot.empty())
        output["dataRoot"] = config.output.dataRoot;
    output["fileFormat"] = config.output.fileFormat;
    if (!config.output.clipboardCommand.empty())
        output["clipboardCommand"] = toJsonArray(config.output.clipboardCommand);
    output["clipboardRetryDelayMs"] = config.output.clipboardRetryDelayMs;
    root["output"] = std::move(output);

    auto notifications = nlohmann::json::object();
    notifications["desktop"] = config.notifications.desktop;
    notifications["command"] = config.notifications.command;
    root["notifications"] = std::move(notifications);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto validateConfig(const AppConfig& config) -> VoidResult
{
    if (auto const chord = makeChord(config.hotkey.modifiers, config.hotkey.key); !chord)
        return configError("hotkey", chord.error().message);

    if (config.transcription.cliPath.empty())
        return configError("transcription.cliPath", "must not be empty");
    if (config.transcription.timeout.count() <= 0)
        return configError("transcription.timeoutSeconds", "must be positive");

    auto const& refinement = config.refinement;
    if (refinement.timeout.count() < 1 || refinement.timeout.count() > 30)
        return configError("refinement.timeoutSeconds", "must be between 1 and 30");

    if (refinement.enabled)
    {
        if (refinement.cliPath.empty())
            return configError("refinement.cliPath", "must not be empty");
        if (refinement.modelPath.empty())
            return configError("refinement.modelPath", "must not be empty when refinement is enabled");

        auto ec = std::error_code {};
        if (!std::filesystem::is_regular_file(refinement.modelPath, ec))
            return configError("refinement.modelPath", std::format("no such file: {}", refinement.modelPath));
        if (refinement.useGlossary && refinement.glossaryPath.empty())
            return configError("refinement.glossaryPath", "must not be empty when the glossary is used");
        if (refinement.temperature < 0.0 || refinement.temperature > 2.0)
            return configError("refinement.temperature", "must be between 0 and 2");
        if (refinement.topP < 0.0 || refinement.topP > 1.0)
            return configError("refinement.topP", "must be between 0 and 1");
        if (refinement.repeatPenalty < 1.0 || refinement.repeatPenalty > 2.0)
            return configError("refinement.repeatPenalty", "must be between 1 and 2");
        if (refinement.maxTokens <= 0)
            return configError("refinement.maxTokens", "must be positive");
    }

    if (config.audio.minDurationMs < 0)
        return configError("audio.minDurationMs", "must not be negative");

    if (config.output.fileFormat != ".md" && config.output.fileFormat != ".txt")
        return configError("output.fileFormat", "must be \".md\" or \".txt\"");
    if (config.output.clipboardRetryDelayMs < 0)
        return configError("output.clipboardRetryDelayMs", "must not be negative");

    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    auto ec = std::error_code {};
    if (!std::filesystem::exists(path, ec))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace dictum
