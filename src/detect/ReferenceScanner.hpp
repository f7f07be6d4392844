// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <detect/TuiProfile.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace klipdot
{

/// @brief Filesystem context for resolving path tokens.
struct ScannerOptions
{
    std::filesystem::path homeDir; ///< Replaces a leading '~'. Empty means $HOME.
    std::filesystem::path baseDir; ///< Resolves relative tokens. Empty means the current directory.
};

/// @brief Finds image references embedded in lines of text.
///
/// Three pattern families are evaluated independently, so one line may yield
/// several detections:
///   - path tokens ending in an image extension that exist on disk,
///   - http(s) URLs whose path ends in an image extension,
///   - inline `data:image/<fmt>;base64,<payload>` URIs.
///
/// The scanner never fails; unresolvable references are dropped.
class ReferenceScanner
{
  public:
    explicit ReferenceScanner(ScannerOptions options = {});

    /// @brief Scans one line.
    /// @param profile Host application profile, or nullptr for generic output.
    /// @param lineNumber Stored in each detection for ordering and diagnostics.
    [[nodiscard]] auto scan(std::string_view line, const TuiProfile* profile = nullptr, std::size_t lineNumber = 0)
        const -> std::vector<DetectedImage>;

    /// @brief Finds URLs that were wrapped across the boundary of two lines.
    ///
    /// Only references that span the join are reported; those wholly within
    /// either line are left to scan().
    [[nodiscard]] auto scanWrapped(std::string_view previous,
                                   std::string_view line,
                                   std::size_t lineNumber = 0) const -> std::vector<DetectedImage>;

    /// @brief Expands '~' and resolves relative paths against the base directory.
    [[nodiscard]] auto resolvePath(std::string_view token) const -> std::filesystem::path;

    [[nodiscard]] auto options() const noexcept -> const ScannerOptions& { return _options; }

  private:
    ScannerOptions _options;
};

/// @brief Returns true if @p name ends in a supported image extension (case-insensitive).
[[nodiscard]] auto hasImageExtension(std::string_view name) -> bool;

/// @brief Returns true for vector (text-based) image extensions, which carry no magic bytes.
[[nodiscard]] auto hasVectorExtension(std::string_view name) -> bool;

/// @brief Returns true if the file exists and, for raster extensions, its header carries an image signature.
[[nodiscard]] auto isImageFile(const std::filesystem::path& path) -> bool;

/// @brief Removes ANSI escape sequences (CSI, OSC, and two-byte ESC sequences) from a line.
[[nodiscard]] auto stripAnsi(std::string_view line) -> std::string;

} // namespace klipdot
