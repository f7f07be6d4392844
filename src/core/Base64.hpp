// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace klipdot::base64
{

/// @brief Encodes bytes with the standard alphabet and '=' padding.
[[nodiscard]] auto encode(std::span<const std::uint8_t> data) -> std::string;

/// @brief Encodes the bytes of a string with the standard alphabet.
[[nodiscard]] auto encode(std::string_view data) -> std::string;

/// @brief Strictly decodes standard base64.
///
/// The input length must be a multiple of four, padding is required, and '='
/// may only appear in the last two positions.
/// @return The decoded bytes, or std::nullopt if the input is malformed.
[[nodiscard]] auto decode(std::string_view text) -> std::optional<Bytes>;

/// @brief Returns true if every character belongs to [A-Za-z0-9+/=].
[[nodiscard]] auto isAlphabet(std::string_view text) noexcept -> bool;

} // namespace klipdot::base64
