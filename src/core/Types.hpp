// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace klipdot
{

/// @brief Raw byte buffer.
using Bytes = std::vector<std::uint8_t>;

/// @brief Destination for raw terminal bytes.
using OutputSink = std::function<void(std::string_view data)>;

/// @brief Image container format, derived from magic bytes only.
enum class ImageFormat : std::uint8_t
{
    Png,
    Jpeg,
    Gif,
    Bmp,
    Webp,
    Tiff,
    Ico,
    Unknown,
};

/// @brief Converts an ImageFormat to its display name.
[[nodiscard]] constexpr auto formatName(ImageFormat format) -> std::string_view
{
    switch (format)
    {
        case ImageFormat::Png: return "PNG";
        case ImageFormat::Jpeg: return "JPEG";
        case ImageFormat::Gif: return "GIF";
        case ImageFormat::Bmp: return "BMP";
        case ImageFormat::Webp: return "WebP";
        case ImageFormat::Tiff: return "TIFF";
        case ImageFormat::Ico: return "ICO";
        case ImageFormat::Unknown: return "Unknown";
    }
    return "Unknown";
}

/// @brief Returns the canonical file extension (without dot) for a format.
[[nodiscard]] constexpr auto formatExtension(ImageFormat format) -> std::string_view
{
    switch (format)
    {
        case ImageFormat::Png: return "png";
        case ImageFormat::Jpeg: return "jpg";
        case ImageFormat::Gif: return "gif";
        case ImageFormat::Bmp: return "bmp";
        case ImageFormat::Webp: return "webp";
        case ImageFormat::Tiff: return "tiff";
        case ImageFormat::Ico: return "ico";
        case ImageFormat::Unknown: return "bin";
    }
    return "bin";
}

/// @brief Where a detected image reference came from.
enum class ImageSource : std::uint8_t
{
    FilePath,
    Url,
    Base64Data,
    StdinPipe,
    ClipboardPayload,
};

/// @brief Converts an ImageSource to a lower-case label.
[[nodiscard]] constexpr auto sourceName(ImageSource source) -> std::string_view
{
    switch (source)
    {
        case ImageSource::FilePath: return "file";
        case ImageSource::Url: return "url";
        case ImageSource::Base64Data: return "base64";
        case ImageSource::StdinPipe: return "stdin";
        case ImageSource::ClipboardPayload: return "clipboard";
    }
    return "unknown";
}

/// @brief An image reference found in a text line or payload.
///
/// For FilePath detections `path` names an existing file. URL and Base64Data
/// detections carry the matched text in `reference` and leave `path` empty
/// until a later step materializes them.
struct DetectedImage
{
    std::filesystem::path path;
    std::string reference;
    ImageSource source = ImageSource::FilePath;
    std::string context;         ///< The originating text line.
    std::size_t lineNumber = 0;  ///< 1-based line counter within its stream.
};

} // namespace klipdot
