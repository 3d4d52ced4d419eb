// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <dictum/App.hpp>
#include <dictum/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>
#include <string>

int main(int argc, char** argv)
{
    auto app = CLI::App { "dictum - hold a hotkey, speak, get text in the clipboard" };

    auto configPath = std::string {};
    auto transcribeFile = std::string {};
    auto dataRoot = std::string {};
    auto verbose = false;
    auto trace = false;
    auto noRefine = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--transcribe", transcribeFile, "Run one session on an existing WAV file and print the text")
        ->check(CLI::ExistingFile);
    app.add_option("--data-root", dataRoot, "Directory for recordings and history");
    app.add_flag("--no-refine", noRefine, "Disable refinement for this run");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--trace", trace, "Log everything, including dictated text");

    CLI11_PARSE(app, argc, argv);

    if (trace)
        dictum::log::setLevel(dictum::log::Level::Trace);
    else if (verbose)
        dictum::log::setLevel(dictum::log::Level::Debug);

    // Load config
    auto configResult = configPath.empty() ? dictum::loadConfig() : dictum::loadConfigFromFile(configPath);
    if (!configResult)
    {
        dictum::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (noRefine)
        config.refinement.enabled = false;
    if (!dataRoot.empty())
        config.output.dataRoot = dataRoot;

    auto application = dictum::App(std::move(config));
    auto initResult = application.initialize(transcribeFile);
    if (!initResult)
    {
        dictum::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return transcribeFile.empty() ? application.run() : application.runOnce();
}
