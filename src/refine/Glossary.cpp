// SPDX-License-Identifier: Apache-2.0
#include "Glossary.hpp"

#include <core/Log.hpp>

#include <format>
#include <fstream>
#include <ranges>
#include <sstream>

namespace dictum
{

namespace
{
    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }
} // namespace

auto parseGlossary(std::string_view content) -> Glossary
{
    auto glossary = Glossary {};
    for (auto const range: content | std::views::split('\n'))
    {
        if (glossary.size() >= MaxGlossaryEntries)
        {
            log::warning("Glossary truncated at {} entries", MaxGlossaryEntries);
            break;
        }

        auto const line = trim(std::string_view(range.begin(), range.end()));
        if (line.empty() || line.starts_with('#'))
            continue;

        auto const separator = line.find('=');
        if (separator == std::string_view::npos)
            continue;

        auto const key = trim(line.substr(0, separator));
        auto const value = trim(line.substr(separator + 1));
        if (key.empty() || value.empty())
            continue;

        glossary[std::string(key)] = std::string(value);
    }
    return glossary;
}

auto loadGlossary(const std::filesystem::path& path) -> Glossary
{
    auto ec = std::error_code {};
    if (path.empty() || !std::filesystem::exists(path, ec))
    {
        log::debug("No glossary at '{}'", path.string());
        return {};
    }

    auto file = std::ifstream(path);
    if (!file.is_open())
    {
        log::error("Cannot read glossary {}", path.string());
        return {};
    }

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto glossary = parseGlossary(ss.str());
    log::info("Glossary loaded: {} entries from {}", glossary.size(), path.string());
    return glossary;
}

auto formatGlossaryForPrompt(const Glossary& glossary) -> std::string
{
    if (glossary.empty())
        return {};

    auto result = std::string { "\n\nAPPLY THESE ABBREVIATIONS:\n" };
    for (auto const& [key, value]: glossary)
        result += std::format("{} = {}\n", key, value);
    return result;
}

} // namespace dictum
