// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>

namespace klipdot
{

/// @brief Writes detected image payloads to the screenshot directory.
class ImageStore
{
  public:
    ImageStore(std::filesystem::path directory, std::uint64_t maxFileSize);

    /// @brief Writes @p bytes as a new image file.
    ///
    /// The file is named `<source>-<UTC timestamp>-<8 hex>.<ext>`, the
    /// extension taken from the sniffed format.
    /// @return The new file's path. InvalidArgument for empty or oversized
    ///         input, UnrecognizedFormat if no image signature matches.
    [[nodiscard]] auto materialize(std::span<const std::uint8_t> bytes, std::string_view source)
        -> Result<std::filesystem::path>;

    /// @brief Deletes regular files older than @p days.
    /// @return The number of files removed.
    [[nodiscard]] auto cleanup(unsigned days) -> Result<std::size_t>;

    [[nodiscard]] auto directory() const noexcept -> const std::filesystem::path& { return _directory; }
    [[nodiscard]] auto maxFileSize() const noexcept -> std::uint64_t { return _maxFileSize; }

  private:
    std::filesystem::path _directory;
    std::uint64_t _maxFileSize;
};

/// @brief Formats a UTC time point as `YYYY-MM-DDTHH-MM-SS.mmmZ` (filename-safe).
[[nodiscard]] auto fileTimestamp(std::chrono::system_clock::time_point when) -> std::string;

} // namespace klipdot
