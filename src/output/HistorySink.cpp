// SPDX-License-Identifier: Apache-2.0
#include "HistorySink.hpp"

#include <core/Log.hpp>
#include <output/Slug.hpp>

#include <chrono>
#include <format>
#include <fstream>
#include <optional>
#include <system_error>

namespace dictum
{

MarkdownHistoryWriter::MarkdownHistoryWriter(std::filesystem::path dataRoot, std::string fileFormat):
    _dataRoot(std::move(dataRoot)), _fileFormat(std::move(fileFormat))
{
    if (_fileFormat.empty())
        _fileFormat = ".md";
    else if (_fileFormat.front() != '.')
        _fileFormat.insert(_fileFormat.begin(), '.');
}

auto MarkdownHistoryWriter::directoryFor(SystemTime created) const -> std::filesystem::path
{
    return _dataRoot / "history" / formatLocalTime(created, "%Y") / formatLocalTime(created, "%Y-%m")
           / formatLocalTime(created, "%Y-%m-%d");
}

auto MarkdownHistoryWriter::render(std::string_view text, const HistoryMetadata& metadata) -> std::string
{
    auto content = std::string {};
    content += "---\n";
    content += std::format("created: {}\n", isoTimestamp(metadata.created));
    content += std::format("lang: {}\n", metadata.language.empty() ? "unknown" : metadata.language);
    content += std::format("stt_model: {}\n", metadata.sttModel.empty() ? "unknown" : metadata.sttModel);
    content += std::format("duration_sec: {:.1f}\n", metadata.durationSeconds);
    content += std::format("post_processed: {}\n", metadata.postProcessed);
    content += "---\n\n";
    content += std::format("# Dictation – {}\n\n", formatLocalTime(metadata.created, "%d.%m.%Y %H:%M"));
    content += text;
    if (!content.ends_with('\n'))
        content += '\n';
    return content;
}

auto MarkdownHistoryWriter::createUnique(const std::filesystem::path& directory,
                                         std::string const& stem,
                                         std::ofstream& file) const -> Result<std::filesystem::path>
{
    // noreplace opens exclusively, so a concurrent writer never truncates an entry.
    auto const tryCreate = [&](const std::filesystem::path& candidate) -> std::optional<Result<std::filesystem::path>> {
        file.open(candidate, std::ios::binary | std::ios::out | std::ios::noreplace);
        if (file.is_open())
            return candidate;
        auto ec = std::error_code {};
        if (!std::filesystem::exists(candidate, ec))
            return makeError(ErrorCode::HistoryWrite, std::format("Cannot open {} for writing", candidate.string()));
        return std::nullopt;
    };

    if (auto created = tryCreate(directory / (stem + _fileFormat)))
        return std::move(*created);

    for (auto suffix = 2; suffix <= MaxDuplicateSuffix; ++suffix)
        if (auto created = tryCreate(directory / std::format("{}_{}{}", stem, suffix, _fileFormat)))
            return std::move(*created);

    auto const fallback =
        directory / std::format("{}_{}{}", stem, compactTimestamp(std::chrono::system_clock::now()), _fileFormat);
    if (auto created = tryCreate(fallback))
        return std::move(*created);
    return makeError(ErrorCode::HistoryWrite, std::format("No free file name for {} in {}", stem, directory.string()));
}

auto MarkdownHistoryWriter::write(std::string_view text, const HistoryMetadata& metadata)
    -> Result<std::filesystem::path>
{
    auto const directory = directoryFor(metadata.created);
    auto ec = std::error_code {};
    std::filesystem::create_directories(directory, ec);
    if (ec)
        return makeError(ErrorCode::HistoryWrite,
                         std::format("Cannot create history directory {}: {}", directory.string(), ec.message()));

    auto const stem = std::format("{}_{}", compactTimestamp(metadata.created), makeSlug(text));
    auto file = std::ofstream {};
    auto created = createUnique(directory, stem, file);
    if (!created)
        return std::unexpected(std::move(created.error()));
    auto const& path = *created;

    file << render(text, metadata);
    file.close();
    if (!file)
        return makeError(ErrorCode::HistoryWrite, std::format("Failed to write {}", path.string()));

    log::info("History entry written: {}", path.string());
    return path;
}

} // namespace dictum
