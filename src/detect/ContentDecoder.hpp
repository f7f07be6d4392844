// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstddef>
#include <optional>
#include <string_view>

namespace klipdot
{

/// @brief Image bytes recovered from a text or binary payload.
struct DecodedImage
{
    Bytes bytes;
    ImageFormat format = ImageFormat::Unknown;
};

/// @brief Minimum length for a bare base64 string to be considered image data.
constexpr auto MinBase64PayloadLength = std::size_t { 100 };

/// @brief Normalizes a payload into raw image bytes.
///
/// Tried in order:
///   1. `data:image/...;base64,` URIs. A missing comma or malformed base64 is
///      a DecodeError. The format is sniffed; a payload with no recognizable
///      signature is returned as ImageFormat::Unknown.
///   2. Bare base64 longer than MinBase64PayloadLength, accepted only when
///      the decoded bytes carry an image signature.
///   3. The raw bytes of @p content, accepted when they carry a signature.
///
/// @return The decoded image, std::nullopt for ordinary non-image content, or
///         a DecodeError for a malformed data URI.
[[nodiscard]] auto decodeContent(std::string_view content) -> Result<std::optional<DecodedImage>>;

/// @brief Returns true if @p content starts with the `data:image/` prefix.
[[nodiscard]] auto isImageDataUri(std::string_view content) noexcept -> bool;

} // namespace klipdot
