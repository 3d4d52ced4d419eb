// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <core/Error.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace dictum
{

/// @brief Facts about a dictation stored alongside its text.
struct HistoryMetadata
{
    SystemTime created {};
    std::string language;
    std::string sttModel;
    double durationSeconds = 0.0;
    bool postProcessed = false;
};

/// @brief Abstract interface for the durable history output.
class HistorySink
{
  public:
    virtual ~HistorySink() = default;

    /// @brief Stores one dictation.
    /// @return The path of the written entry, or ErrorCode::HistoryWrite.
    [[nodiscard]] virtual auto write(std::string_view text, const HistoryMetadata& metadata)
        -> Result<std::filesystem::path> = 0;
};

/// @brief Writes one Markdown (or plain text) file per dictation into a date-based tree.
///
/// Layout: <dataRoot>/history/YYYY/YYYY-MM/YYYY-MM-DD/YYYYMMDD_HHMMSSmmm_<slug><ext>
class MarkdownHistoryWriter: public HistorySink
{
  public:
    /// @brief Highest numeric suffix tried before falling back to a fresh timestamp.
    static constexpr int MaxDuplicateSuffix = 999;

    /// @param dataRoot Root of the data directory.
    /// @param fileFormat File extension including the dot, ".md" or ".txt".
    explicit MarkdownHistoryWriter(std::filesystem::path dataRoot, std::string fileFormat = ".md");

    [[nodiscard]] auto write(std::string_view text, const HistoryMetadata& metadata)
        -> Result<std::filesystem::path> override;

    /// @brief Returns the directory an entry created at the given time goes into.
    [[nodiscard]] auto directoryFor(SystemTime created) const -> std::filesystem::path;

    /// @brief Renders the file content: YAML front matter, heading, text.
    [[nodiscard]] static auto render(std::string_view text, const HistoryMetadata& metadata) -> std::string;

  private:
    /// @brief Creates the first free file name for the stem, failing rather than replacing an existing file.
    [[nodiscard]] auto createUnique(const std::filesystem::path& directory,
                                    std::string const& stem,
                                    std::ofstream& file) const -> Result<std::filesystem::path>;

    std::filesystem::path _dataRoot;
    std::string _fileFormat;
};

} // namespace dictum
