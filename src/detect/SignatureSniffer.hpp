// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace klipdot
{

/// @brief Number of leading bytes classify() may inspect.
constexpr auto SignatureProbeSize = std::size_t { 12 };

/// @brief Classifies a buffer as image data by its magic-byte prefix.
///
/// Signatures are tried in a fixed order (PNG, JPEG, GIF, BMP, WEBP, TIFF,
/// ICO); the first match wins. A signature whose prefix is longer than the
/// buffer is skipped. Buffers shorter than four bytes never match.
/// @return The detected format, or std::nullopt if no signature matches.
[[nodiscard]] auto classify(std::span<const std::uint8_t> data) noexcept -> std::optional<ImageFormat>;

/// @brief Convenience overload for text buffers carrying raw bytes.
[[nodiscard]] auto classify(std::string_view data) noexcept -> std::optional<ImageFormat>;

} // namespace klipdot
