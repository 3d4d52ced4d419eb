// SPDX-License-Identifier: Apache-2.0
#include <core/Clock.hpp>
#include <output/ClipboardSink.hpp>
#include <output/HistorySink.hpp>
#include <output/Notifier.hpp>
#include <output/Slug.hpp>
#include <process/ProcessRunner.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <chrono>
#include <filesystem>
#include <format>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "MockRunner.hpp"
#include "TestUtils.hpp"

using namespace dictum;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::EndsWith;
using Catch::Matchers::StartsWith;

TEST_CASE("makeSlug", "[output]")
{
    CHECK(makeSlug("Hello World") == "hello-world");
    CHECK(makeSlug("  Meeting   notes_for  Monday!  ") == "meeting-notes-for-monday");
    CHECK(makeSlug("Größe über Maß") == "grosse-uber-mass");
    CHECK(makeSlug("Ärger mit Öl") == "arger-mit-ol");
    CHECK(makeSlug("Café déjà vu") == "cafe-deja-vu");
    CHECK(makeSlug("a--b") == "a-b");
    CHECK(makeSlug("") == DefaultSlug);
    CHECK(makeSlug("!!! ???") == DefaultSlug);
    CHECK(makeSlug("日本語") == DefaultSlug);

    SECTION("long text is cut at a word boundary")
    {
        auto const slug = makeSlug("the quick brown fox jumps over the lazy dog and keeps running far away");
        CHECK(slug.size() <= 50);
        CHECK(slug == "the-quick-brown-fox-jumps-over-the-lazy-dog-and");
    }

    SECTION("a long single word is cut hard")
    {
        auto const slug = makeSlug(std::string(80, 'x'));
        CHECK(slug == std::string(50, 'x'));
    }

    SECTION("custom length")
    {
        CHECK(makeSlug("alpha beta gamma", 10) == "alpha-beta");
    }
}

TEST_CASE("MarkdownHistoryWriter::render", "[output]")
{
    auto const created = std::chrono::system_clock::now();
    auto const metadata = HistoryMetadata {
        .created = created,
        .language = "de",
        .sttModel = "ggml-base.bin",
        .durationSeconds = 4.26,
        .postProcessed = true,
    };

    auto const content = MarkdownHistoryWriter::render("Hallo Welt", metadata);
    CHECK_THAT(content, StartsWith("---\ncreated: " + isoTimestamp(created) + "\n"));
    CHECK_THAT(content, ContainsSubstring("lang: de\n"));
    CHECK_THAT(content, ContainsSubstring("stt_model: ggml-base.bin\n"));
    CHECK_THAT(content, ContainsSubstring("duration_sec: 4.3\n"));
    CHECK_THAT(content, ContainsSubstring("post_processed: true\n---\n\n# Dictation – "));
    CHECK_THAT(content, ContainsSubstring(formatLocalTime(created, "%d.%m.%Y %H:%M")));
    CHECK_THAT(content, EndsWith("\n\nHallo Welt\n"));

    SECTION("unknown language and model")
    {
        auto const plain = MarkdownHistoryWriter::render("x\n", HistoryMetadata { .created = created });
        CHECK_THAT(plain, ContainsSubstring("lang: unknown\n"));
        CHECK_THAT(plain, ContainsSubstring("stt_model: unknown\n"));
        CHECK_THAT(plain, ContainsSubstring("post_processed: false\n"));
        CHECK_THAT(plain, EndsWith("\n\nx\n"));
    }
}

TEST_CASE("MarkdownHistoryWriter writes into the date tree", "[output]")
{
    auto const dir = test::TempDir {};
    auto const created = std::chrono::system_clock::now();
    auto const metadata = HistoryMetadata { .created = created, .language = "en" };

    SECTION("layout and file name")
    {
        auto writer = MarkdownHistoryWriter(dir.path());
        auto const path = writer.write("Buy milk tomorrow", metadata);
        REQUIRE(path.has_value());

        auto const expectedDir = dir.path() / "history" / formatLocalTime(created, "%Y")
                                 / formatLocalTime(created, "%Y-%m") / formatLocalTime(created, "%Y-%m-%d");
        CHECK(path->parent_path() == expectedDir);
        CHECK(writer.directoryFor(created) == expectedDir);
        CHECK(path->filename().string() == compactTimestamp(created) + "_buy-milk-tomorrow.md");
        CHECK_THAT(test::readFile(*path), EndsWith("Buy milk tomorrow\n"));
    }

    SECTION("duplicates get a numeric suffix")
    {
        auto writer = MarkdownHistoryWriter(dir.path());
        auto const first = writer.write("same text", metadata);
        auto const second = writer.write("same text", metadata);
        auto const third = writer.write("same text", metadata);
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        REQUIRE(third.has_value());
        auto const stem = compactTimestamp(created) + "_same-text";
        CHECK(first->filename().string() == stem + ".md");
        CHECK(second->filename().string() == stem + "_2.md");
        CHECK(third->filename().string() == stem + "_3.md");
    }

    SECTION("an existing entry is never replaced")
    {
        auto writer = MarkdownHistoryWriter(dir.path());
        auto const stem = compactTimestamp(created) + "_same-text";
        test::writeFile(writer.directoryFor(created) / (stem + ".md"), "earlier entry");

        auto const path = writer.write("same text", metadata);
        REQUIRE(path.has_value());
        CHECK(path->filename().string() == stem + "_2.md");
        CHECK(test::readFile(writer.directoryFor(created) / (stem + ".md")) == "earlier entry");
    }

    SECTION("concurrent writers get distinct files")
    {
        auto writer = MarkdownHistoryWriter(dir.path());
        auto paths = std::vector<std::filesystem::path>(8);
        {
            auto threads = std::vector<std::jthread> {};
            for (auto i = 0u; i < paths.size(); ++i)
                threads.emplace_back([&, i] {
                    if (auto const path = writer.write("same text", metadata))
                        paths[i] = *path;
                });
        }

        auto const unique = std::set<std::filesystem::path>(paths.begin(), paths.end());
        CHECK(unique.size() == paths.size());
        CHECK_FALSE(unique.contains(std::filesystem::path {}));
        for (auto const& path: unique)
            CHECK_THAT(test::readFile(path), EndsWith("same text\n"));
    }

    SECTION("plain text format")
    {
        auto writer = MarkdownHistoryWriter(dir.path(), "txt");
        auto const path = writer.write("note", metadata);
        REQUIRE(path.has_value());
        CHECK(path->extension() == ".txt");
    }

    SECTION("unwritable data root")
    {
        test::writeFile(dir / "blocker", "not a directory");
        auto writer = MarkdownHistoryWriter(dir / "blocker");
        auto const path = writer.write("note", metadata);
        REQUIRE(!path.has_value());
        CHECK(path.error().code == ErrorCode::HistoryWrite);
    }
}

TEST_CASE("CommandClipboard pipes the text into the clipboard tool", "[output]")
{
    auto const dir = test::TempDir {};
    auto runner = SubprocessRunner {};

    SECTION("success")
    {
        auto const captured = dir / "clipboard.txt";
        auto const script = test::writeScript(dir / "copy.sh", std::format("cat > '{}'", captured.string()));
        auto clipboard = CommandClipboard({ script }, runner);
        REQUIRE(clipboard.write("Grüße aus dem Diktat").has_value());
        CHECK(test::readFile(captured) == "Grüße aus dem Diktat");
    }

    SECTION("non-zero exit is a locked clipboard")
    {
        auto const script = test::writeScript(dir / "locked.sh", "cat > /dev/null; echo 'no display' >&2; exit 1");
        auto clipboard = CommandClipboard({ script }, runner);
        auto const result = clipboard.write("text");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ClipboardLocked);
        CHECK(result.error().exitCode == 1);
        CHECK_THAT(result.error().stderrText, ContainsSubstring("no display"));
    }

    SECTION("missing tool")
    {
        auto clipboard = CommandClipboard({ (dir / "does-not-exist").string() }, runner);
        auto const result = clipboard.write("text");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ClipboardLocked);
    }

    SECTION("no command")
    {
        auto clipboard = CommandClipboard({}, runner);
        auto const result = clipboard.write("text");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ClipboardLocked);
    }
}

TEST_CASE("CommandClipboard passes arguments and keeps the tool's children alive", "[output]")
{
    auto mock = test::MockRunner {};
    mock.queueOutput(0, "");
    auto clipboard = CommandClipboard({ "xclip", "-selection", "clipboard" }, mock);
    REQUIRE(clipboard.write("hello").has_value());

    REQUIRE(mock.calls.size() == 1);
    auto const& spec = mock.calls.front();
    CHECK(spec.command == "xclip");
    CHECK(spec.args == std::vector<std::string> { "-selection", "clipboard" });
    CHECK(spec.stdinData == "hello");
    CHECK_FALSE(spec.killDescendantsOnExit);
}

TEST_CASE("DesktopNotifier", "[output]")
{
    auto mock = test::MockRunner {};

    SECTION("maps the kind to an urgency and hides the message in logs")
    {
        mock.queueOutput(0, "");
        mock.queueOutput(0, "");
        mock.queueOutput(0, "");
        auto notifier = DesktopNotifier(&mock);
        notifier.notify("Copied to clipboard (5 chars)", NotificationKind::Success);
        notifier.notify("history not saved", NotificationKind::Warning);
        notifier.notify("Dictation failed", NotificationKind::Error);
        notifier.flush();

        REQUIRE(mock.calls.size() == 3);
        CHECK(mock.calls[0].command == "notify-send");
        CHECK(mock.calls[0].args
              == std::vector<std::string> { "-a", "dictum", "-u", "low", "Dictum", "Copied to clipboard (5 chars)" });
        CHECK(mock.calls[1].args[3] == "normal");
        CHECK(mock.calls[2].args[3] == "critical");
        CHECK_THAT(describe(mock.calls[0]), !ContainsSubstring("Copied"));
    }

    SECTION("failures are swallowed")
    {
        mock.queueError(ErrorCode::ProcessError, "not installed");
        mock.queueOutput(1, "");
        auto notifier = DesktopNotifier(&mock, "my-notify");
        notifier.notify("one", NotificationKind::Warning);
        notifier.notify("two", NotificationKind::Warning);
        notifier.flush();
        CHECK(mock.calls.size() == 2);
        CHECK(mock.calls[0].command == "my-notify");
    }

    SECTION("log-only without a runner")
    {
        auto notifier = DesktopNotifier(nullptr);
        notifier.notify("quiet", NotificationKind::Success);
        notifier.flush();
        CHECK(mock.calls.empty());
    }

    SECTION("pending notifications are shown on destruction")
    {
        mock.queueOutput(0, "");
        {
            auto notifier = DesktopNotifier(&mock);
            notifier.notify("last words", NotificationKind::Success);
        }
        CHECK(mock.calls.size() == 1);
    }
}

#ifndef _WIN32
TEST_CASE("DesktopNotifier does not wait for a slow notification command", "[output]")
{
    auto const dir = test::TempDir("dictum_notify");
    auto runner = SubprocessRunner {};
    auto const command = test::writeScript(dir / "notify.sh", "sleep 1");
    auto notifier = DesktopNotifier(&runner, command);

    auto const started = std::chrono::steady_clock::now();
    notifier.notify("first", NotificationKind::Success);
    notifier.notify("second", NotificationKind::Warning);
    CHECK(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(500));

    notifier.flush();
    CHECK(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(1000));
}
#endif
