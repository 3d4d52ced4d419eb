// SPDX-License-Identifier: Apache-2.0
#include <refine/Glossary.hpp>
#include <refine/PromptBuilder.hpp>
#include <refine/RefinementAdapter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>

#include "MockRunner.hpp"
#include "TestUtils.hpp"

using namespace dictum;
using namespace std::chrono_literals;

namespace
{

auto hasArg(const ProcessSpec& spec, std::string_view arg) -> bool
{
    return std::ranges::find(spec.args, arg) != spec.args.end();
}

auto enabledConfig() -> RefinementConfig
{
    auto config = RefinementConfig {};
    config.enabled = true;
    config.modelPath = "/models/qwen.gguf";
    return config;
}

} // namespace

// {{{ Glossary

TEST_CASE("parseGlossary reads abbreviation lines", "[refine]")
{
    auto const glossary = parseGlossary("# team terms\n"
                                        "\n"
                                        "  PR = pull request \n"
                                        "invalid line\n"
                                        "=no key\n"
                                        "no value =\n"
                                        "k8s=Kubernetes\r\n"
                                        "eq = a = b\n");
    REQUIRE(glossary.size() == 3);
    CHECK(glossary.at("PR") == "pull request");
    CHECK(glossary.at("k8s") == "Kubernetes");
    CHECK(glossary.at("eq") == "a = b");
}

TEST_CASE("parseGlossary keeps at most MaxGlossaryEntries entries", "[refine]")
{
    auto content = std::string {};
    for (auto i = std::size_t { 0 }; i < MaxGlossaryEntries + 20; ++i)
        content += std::format("k{} = v{}\n", i, i);
    CHECK(parseGlossary(content).size() == MaxGlossaryEntries);
}

TEST_CASE("loadGlossary returns an empty map for a missing file", "[refine]")
{
    auto const dir = test::TempDir("dictum_glossary");
    CHECK(loadGlossary(dir / "missing.txt").empty());

    test::writeFile(dir / "glossary.txt", "ASAP = as soon as possible\n");
    auto const glossary = loadGlossary(dir / "glossary.txt");
    REQUIRE(glossary.size() == 1);
    CHECK(glossary.at("ASAP") == "as soon as possible");
}

TEST_CASE("formatGlossaryForPrompt lists every entry", "[refine]")
{
    CHECK(formatGlossaryForPrompt({}).empty());
    CHECK(formatGlossaryForPrompt({ { "PR", "pull request" }, { "k8s", "Kubernetes" } })
          == "\n\nAPPLY THESE ABBREVIATIONS:\nPR = pull request\nk8s = Kubernetes\n");
}

// }}}
// {{{ PromptBuilder

TEST_CASE("detectRefinementMode finds the markdown trigger", "[refine]")
{
    SECTION("no trigger")
    {
        auto const detection = detectRefinementMode("just some words about markdown");
        CHECK(detection.mode == RefinementMode::Plain);
        CHECK(detection.text == "just some words about markdown");
    }

    SECTION("leading trigger with punctuation")
    {
        auto const detection = detectRefinementMode("Markdown Mode, shopping list eggs milk");
        CHECK(detection.mode == RefinementMode::Markdown);
        CHECK(detection.text == "shopping list eggs milk");
    }

    SECTION("trailing trigger")
    {
        auto const detection = detectRefinementMode("shopping list eggs milk. markdown mode");
        CHECK(detection.mode == RefinementMode::Markdown);
        CHECK(detection.text == "shopping list eggs milk");
    }

    SECTION("trigger inside a longer word does not count")
    {
        auto const detection = detectRefinementMode("the xmarkdown modes are fine");
        CHECK(detection.mode == RefinementMode::Plain);
    }

    SECTION("trigger in the middle of a long text does not count")
    {
        auto text = std::string {};
        for (auto i = 0; i < 25; ++i)
            text += "word ";
        text += "markdown mode ";
        for (auto i = 0; i < 25; ++i)
            text += "word ";
        CHECK(detectRefinementMode(text).mode == RefinementMode::Plain);
    }

    SECTION("trigger within the last words of a long text")
    {
        auto text = std::string {};
        for (auto i = 0; i < 40; ++i)
            text += "word ";
        text += "markdown mode";
        auto const detection = detectRefinementMode(text);
        CHECK(detection.mode == RefinementMode::Markdown);
        CHECK(!detection.text.ends_with("mode"));
    }
}

TEST_CASE("buildSystemPrompt selects rules and appends the glossary", "[refine]")
{
    auto const plain = buildSystemPrompt(RefinementMode::Plain, {});
    CHECK(plain.find("Plain text only") != std::string::npos);
    CHECK(plain.find("APPLY THESE ABBREVIATIONS") == std::string::npos);

    auto const markdown = buildSystemPrompt(RefinementMode::Markdown, { { "PR", "pull request" } });
    CHECK(markdown.find("Use Markdown formatting") != std::string::npos);
    CHECK(markdown.ends_with("APPLY THESE ABBREVIATIONS:\nPR = pull request\n"));
}

// }}}
// {{{ RefinementAdapter

TEST_CASE("RefinementAdapter builds the llama command line", "[refine]")
{
    auto runner = test::MockRunner {};
    auto const adapter = RefinementAdapter(enabledConfig(), runner);

    auto const gpu = adapter.buildSpec("SYSTEM", "user text", true);
    CHECK(gpu.command == "llama-cli");
    CHECK(gpu.args
          == std::vector<std::string> { "-m",
                                        "/models/qwen.gguf",
                                        "-sys",
                                        "SYSTEM",
                                        "-p",
                                        "user text",
                                        "--temp",
                                        "0.00",
                                        "--top-p",
                                        "0.25",
                                        "--repeat-penalty",
                                        "1.05",
                                        "-n",
                                        "512",
                                        "--no-display-prompt",
                                        "-ngl",
                                        "99" });
    CHECK(describe(gpu).find("user text") == std::string::npos);

    auto const cpu = adapter.buildSpec("SYSTEM", "user text", false);
    CHECK_FALSE(hasArg(cpu, "-ngl"));
}

TEST_CASE("RefinementAdapter returns the refined text without engine noise", "[refine]")
{
    auto runner = test::MockRunner {};
    runner.queueOutput(0,
                       "llama_model_loader: loaded meta data\n"
                       "main: build = 1234\n"
                       "  system_info: n_threads = 8\n"
                       "\n"
                       "Hello, world.\n"
                       "Second line.\n"
                       "\n"
                       "[end of text]\n");
    auto adapter = RefinementAdapter(enabledConfig(), runner);

    auto const result = adapter.refine(RefinementRequest { .text = "hello world second line" });
    REQUIRE(result.has_value());
    CHECK(result->text == "Hello, world.\nSecond line.");
    CHECK(result->mode == RefinementMode::Plain);
    CHECK(result->succeeded);
    REQUIRE(runner.calls.size() == 1);
    CHECK(hasArg(runner.calls[0], "-ngl"));
}

TEST_CASE("RefinementAdapter passes mode and glossary into the prompt", "[refine]")
{
    auto runner = test::MockRunner {};
    runner.queueOutput(0, "- eggs\n- milk\n");
    auto adapter = RefinementAdapter(enabledConfig(), runner);

    auto const result = adapter.refine(
        RefinementRequest { .text = "markdown mode eggs and milk", .glossary = { { "PR", "pull request" } } });
    REQUIRE(result.has_value());
    CHECK(result->mode == RefinementMode::Markdown);
    REQUIRE(runner.calls.size() == 1);
    CHECK(runner.calls[0].args[3].find("Use Markdown formatting") != std::string::npos);
    CHECK(runner.calls[0].args[3].find("PR = pull request") != std::string::npos);
    CHECK(runner.calls[0].args[5] == "eggs and milk");
}

TEST_CASE("RefinementAdapter retries once without GPU on a GPU failure", "[refine]")
{
    auto runner = test::MockRunner {};
    auto adapter = RefinementAdapter(enabledConfig(), runner);

    SECTION("second attempt succeeds")
    {
        runner.queueOutput(1, "", "ggml_cuda_init: failed to initialize CUDA: out of memory");
        runner.queueOutput(0, "Hello, world.");

        auto const result = adapter.refine(RefinementRequest { .text = "hello world" });
        REQUIRE(result.has_value());
        CHECK(result->text == "Hello, world.");
        REQUIRE(runner.calls.size() == 2);
        CHECK(hasArg(runner.calls[0], "-ngl"));
        CHECK_FALSE(hasArg(runner.calls[1], "-ngl"));
    }

    SECTION("second attempt fails too")
    {
        runner.queueOutput(1, "", "CUDA error: out of memory");
        runner.queueOutput(1, "", "CUDA error: out of memory");
        runner.queueOutput(0, "never used");

        auto const result = adapter.refine(RefinementRequest { .text = "hello world" });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ProcessError);
        CHECK(result.error().exitCode == 1);
        CHECK(runner.calls.size() == 2);
    }
}

TEST_CASE("RefinementAdapter does not retry other failures", "[refine]")
{
    auto runner = test::MockRunner {};

    SECTION("non-GPU failure")
    {
        runner.queueOutput(1, "", "error: unknown argument");
        auto adapter = RefinementAdapter(enabledConfig(), runner);
        auto const result = adapter.refine(RefinementRequest { .text = "hello world" });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ProcessError);
        CHECK(runner.calls.size() == 1);
    }

    SECTION("GPU failure with GPU acceleration off")
    {
        runner.queueOutput(1, "", "CUDA error: out of memory");
        auto config = enabledConfig();
        config.gpuAcceleration = false;
        auto adapter = RefinementAdapter(config, runner);
        auto const result = adapter.refine(RefinementRequest { .text = "hello world" });
        REQUIRE(!result.has_value());
        CHECK(runner.calls.size() == 1);
        CHECK_FALSE(hasArg(runner.calls[0], "-ngl"));
    }

    SECTION("timeout")
    {
        runner.queueError(ErrorCode::Timeout, "did not finish");
        auto adapter = RefinementAdapter(enabledConfig(), runner);
        auto const result = adapter.refine(RefinementRequest { .text = "hello world" });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::Timeout);
        CHECK(runner.calls.size() == 1);
    }
}

TEST_CASE("RefinementAdapter uses the configured GPU failure patterns", "[refine]")
{
    auto runner = test::MockRunner {};
    runner.queueOutput(1, "", "backend says: VRAM EXHAUSTED");
    runner.queueOutput(0, "ok");

    auto config = enabledConfig();
    config.gpuFailurePatterns = { "vram exhausted" };
    auto adapter = RefinementAdapter(config, runner);

    CHECK_FALSE(adapter.isGpuFailure("CUDA error: out of memory"));
    CHECK(adapter.isGpuFailure("VRAM exhausted"));

    auto const result = adapter.refine(RefinementRequest { .text = "hello" });
    REQUIRE(result.has_value());
    CHECK(runner.calls.size() == 2);
}

TEST_CASE("RefinementAdapter rejects empty input and empty output", "[refine]")
{
    auto runner = test::MockRunner {};
    auto adapter = RefinementAdapter(enabledConfig(), runner);

    SECTION("blank input is not sent")
    {
        auto const result = adapter.refine(RefinementRequest { .text = " \n " });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::InvalidInput);
        CHECK(runner.calls.empty());
    }

    SECTION("output with only engine noise")
    {
        runner.queueOutput(0, "llama_perf_context_print: load time = 1 ms\n\n[end of text]\n");
        auto const result = adapter.refine(RefinementRequest { .text = "hello" });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::EmptyOutput);
    }
}

#ifndef _WIN32
TEST_CASE("RefinementAdapter stops a hanging backend at the timeout", "[refine]")
{
    auto const dir = test::TempDir("dictum_refine");
    auto runner = SubprocessRunner {};
    auto config = enabledConfig();
    config.cliPath = test::writeScript(dir / "llama.sh", "sleep 60");
    config.timeout = 1s;
    auto adapter = RefinementAdapter(config, runner);

    auto const started = std::chrono::steady_clock::now();
    auto const result = adapter.refine(RefinementRequest { .text = "hello world" });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::Timeout);
    CHECK(std::chrono::steady_clock::now() - started < 1200ms);
}
#endif

// }}}
