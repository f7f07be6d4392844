// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

namespace klipdot
{

/// @brief Pixel dimensions read from an image header.
struct Dimensions
{
    std::uint32_t width = 0;
    std::uint32_t height = 0;
};

/// @brief Summary of an image file used by text fallbacks.
struct ImageInfo
{
    std::filesystem::path path;
    std::uintmax_t fileSize = 0;
    std::optional<ImageFormat> format;
    std::optional<Dimensions> dimensions;
};

/// @brief Reads width and height from a PNG, GIF, BMP, JPEG, or WEBP header.
/// @return The dimensions, or std::nullopt if the header is unknown or truncated.
[[nodiscard]] auto readDimensions(std::span<const std::uint8_t> data) -> std::optional<Dimensions>;

/// @brief Collects size, sniffed format, and dimensions of an image file.
[[nodiscard]] auto inspectImageFile(const std::filesystem::path& path) -> Result<ImageInfo>;

/// @brief Formats a byte count as "500 B", "1.5 KB", "1.4 MB", or "2.0 GB".
[[nodiscard]] auto formatFileSize(std::uint64_t bytes) -> std::string;

} // namespace klipdot
