// SPDX-License-Identifier: Apache-2.0
#include "PromptBuilder.hpp"

#include <refine/Glossary.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <vector>

namespace dictum
{

namespace
{
    constexpr auto CommonPrompt = std::string_view {
        "System: You are a careful transcript formatter and light copy editor.\n"
        "\n"
        "INPUT: Raw text from speech recognition (Whisper). May contain run-on sentences, missing punctuation.\n"
        "\n"
        "YOUR GOAL: Make text easy to read while preserving intent and personality.\n"
        "\n"
        "DO:\n"
        "- Fix grammar, punctuation, capitalization.\n"
        "- Split long sentences when it improves clarity.\n"
        "- Insert paragraph breaks between distinct topics.\n"
    };

    constexpr auto PlainRules = std::string_view {
        "- Turn clearly spoken lists into simple bullets (- item) or numbers (1. item).\n"
        "- Remove filler words (\"uh\", \"um\", \"like\") when safe.\n"
        "\n"
        "DON'T:\n"
        "- Don't add new ideas or explanations.\n"
        "- Don't change meaning.\n"
        "- Don't summarize or shorten.\n"
        "- Don't change technical terms or names.\n"
        "- Don't use Markdown headings, bold, italics.\n"
        "\n"
        "OUTPUT: Plain text only. Blank lines between paragraphs. Simple lists only.\n"
    };

    constexpr auto MarkdownRules = std::string_view {
        "- Use Markdown formatting (## Heading, **bold**, - lists).\n"
        "- Remove filler words (\"uh\", \"um\", \"like\") when safe.\n"
        "\n"
        "DON'T:\n"
        "- Don't add new ideas or explanations.\n"
        "- Don't change meaning.\n"
        "- Don't summarize or shorten.\n"
        "- Don't change technical terms or names.\n"
        "\n"
        "OUTPUT: Markdown formatted text.\n"
    };

    struct Word
    {
        std::size_t begin;
        std::size_t end;
    };

    auto isSpace(char c) -> bool
    {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    auto isWordChar(char c) -> bool
    {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
    }

    auto isClausePunctuation(char c) -> bool
    {
        return c == '.' || c == ',' || c == ';' || c == ':';
    }

    auto equalsIgnoreCase(std::string_view a, std::string_view b) -> bool
    {
        return std::ranges::equal(a, b, [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
        });
    }

    auto splitWords(std::string_view text) -> std::vector<Word>
    {
        auto words = std::vector<Word> {};
        auto i = std::size_t { 0 };
        while (i < text.size())
        {
            while (i < text.size() && isSpace(text[i]))
                ++i;
            if (i == text.size())
                break;
            auto const begin = i;
            while (i < text.size() && !isSpace(text[i]))
                ++i;
            words.push_back(Word { .begin = begin, .end = i });
        }
        return words;
    }

    /// @brief Byte range of a "markdown mode" match, from the 'm' of markdown to the 'e' of mode.
    struct Match
    {
        std::size_t wordIndex;
        std::size_t begin;
        std::size_t end;
    };

    /// @brief Finds "markdown" ending a word followed by "mode" starting the next one, on word boundaries.
    auto findTrigger(std::string_view text, std::vector<Word> const& words, std::size_t first, std::size_t last)
        -> std::optional<Match>
    {
        constexpr auto Markdown = std::string_view { "markdown" };
        constexpr auto Mode = std::string_view { "mode" };

        for (auto i = first; i + 1 < last; ++i)
        {
            auto const lhs = text.substr(words[i].begin, words[i].end - words[i].begin);
            auto const rhs = text.substr(words[i + 1].begin, words[i + 1].end - words[i + 1].begin);
            if (lhs.size() < Markdown.size() || rhs.size() < Mode.size())
                continue;

            auto const markdownAt = lhs.size() - Markdown.size();
            if (!equalsIgnoreCase(lhs.substr(markdownAt), Markdown))
                continue;
            if (markdownAt > 0 && isWordChar(lhs[markdownAt - 1]))
                continue;
            if (!equalsIgnoreCase(rhs.substr(0, Mode.size()), Mode))
                continue;
            if (rhs.size() > Mode.size() && isWordChar(rhs[Mode.size()]))
                continue;

            return Match {
                .wordIndex = i,
                .begin = words[i].begin + markdownAt,
                .end = words[i + 1].begin + Mode.size(),
            };
        }
        return std::nullopt;
    }

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }
} // namespace

auto detectRefinementMode(std::string_view transcript) -> ModeDetection
{
    auto const words = splitWords(transcript);
    auto const count = words.size();

    auto match = findTrigger(transcript, words, 0, std::min(count, MarkdownTriggerWindow));
    if (!match && count > MarkdownTriggerWindow)
        match = findTrigger(transcript, words, count - MarkdownTriggerWindow, count);

    if (!match)
        return ModeDetection { .mode = RefinementMode::Plain, .text = std::string(transcript) };

    auto begin = match->begin;
    auto end = match->end;

    // Swallow one clause mark after the phrase plus following blanks.
    if (end < transcript.size() && isClausePunctuation(transcript[end]))
        ++end;
    auto const atEnd = match->wordIndex + 2 == count;
    if (atEnd && begin > 0)
    {
        // Trailing trigger: drop the separating blanks and one clause mark before it.
        while (begin > 0 && isSpace(transcript[begin - 1]))
            --begin;
        if (begin > 0 && isClausePunctuation(transcript[begin - 1]))
            --begin;
    }
    else
    {
        while (end < transcript.size() && isSpace(transcript[end]))
            ++end;
    }

    auto cleaned = std::string(transcript.substr(0, begin));
    cleaned += transcript.substr(end);
    return ModeDetection { .mode = RefinementMode::Markdown, .text = std::string(trim(cleaned)) };
}

auto buildSystemPrompt(RefinementMode mode, const Glossary& glossary) -> std::string
{
    auto prompt = std::string(CommonPrompt);
    prompt += mode == RefinementMode::Markdown ? MarkdownRules : PlainRules;
    prompt += formatGlossaryForPrompt(glossary);
    return prompt;
}

} // namespace dictum
