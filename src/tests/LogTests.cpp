// SPDX-License-Identifier: Apache-2.0
#include <core/Error.hpp>
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <format>
#include <string>
#include <thread>
#include <vector>

using namespace dictum;

namespace
{

/// @brief Routes log output into a vector for the lifetime of the object.
struct CapturedLog
{
    struct Line
    {
        log::Level level;
        std::string message;
    };

    std::vector<Line> lines;
    log::Level previousLevel = log::getLevel();

    explicit CapturedLog(log::Level level)
    {
        log::setLevel(level);
        log::setCallback([this](log::Level lineLevel, std::string_view message) {
            lines.push_back(Line { .level = lineLevel, .message = std::string(message) });
        });
    }

    ~CapturedLog()
    {
        log::setCallback({});
        log::setLevel(previousLevel);
    }
};

} // namespace

TEST_CASE("log filters by level", "[core]")
{
    auto captured = CapturedLog(log::Level::Info);

    log::error("e {}", 1);
    log::warning("w");
    log::info("i {}", "x");
    log::debug("d");
    log::trace("t");

    REQUIRE(captured.lines.size() == 3);
    CHECK(captured.lines[0].level == log::Level::Error);
    CHECK(captured.lines[0].message == "e 1");
    CHECK(captured.lines[2].message == "i x");

    log::setLevel(log::Level::Trace);
    log::trace("secret text");
    CHECK(captured.lines.back().level == log::Level::Trace);
}

TEST_CASE("log keeps lines whole across threads", "[core]")
{
    auto captured = CapturedLog(log::Level::Info);

    constexpr auto ThreadCount = 8;
    constexpr auto LinesPerThread = 50;
    {
        auto threads = std::vector<std::jthread> {};
        for (auto t = 0; t < ThreadCount; ++t)
            threads.emplace_back([t] {
                for (auto i = 0; i < LinesPerThread; ++i)
                    log::info("thread {} line {}", t, i);
            });
    }

    CHECK(captured.lines.size() == ThreadCount * LinesPerThread);
    for (auto const& line: captured.lines)
        CHECK(line.message.starts_with("thread "));
}

TEST_CASE("Error formats with its code name", "[core]")
{
    auto const error = Error { .code = ErrorCode::ClipboardLocked, .message = "busy" };
    CHECK(std::format("{}", error) == "[ClipboardLocked] busy");
    CHECK(errorCodeName(ErrorCode::InvalidTransition) == "InvalidTransition");
    CHECK(log::levelName(log::Level::Warning) == "WARN ");
}
