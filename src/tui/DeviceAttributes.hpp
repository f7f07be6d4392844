// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace klipdot::tui
{

/// @brief Parses a primary device attributes reply (`CSI ? Ps ; ... c`).
/// @return The numeric parameters, or an empty vector if @p reply is not a DA1 reply.
[[nodiscard]] auto parseDeviceAttributes(std::string_view reply) -> std::vector<int>;

/// @brief Returns true if DA1 parameters advertise sixel graphics (attribute 4).
///
/// The first parameter is the terminal class and is not an attribute.
[[nodiscard]] auto hasSixelAttribute(const std::vector<int>& params) noexcept -> bool;

/// @brief Sends DA1 to the controlling terminal and waits for the reply.
///
/// Puts the terminal into raw mode for the duration of the query.
/// @return The raw reply, or std::nullopt if stdin/stdout is not a terminal
///         or no reply arrived within @p timeout.
[[nodiscard]] auto queryDeviceAttributes(std::chrono::milliseconds timeout) -> std::optional<std::string>;

/// @brief Queries the terminal and reports sixel support; a timeout means unsupported.
[[nodiscard]] auto querySixelSupport(std::chrono::milliseconds timeout) -> bool;

} // namespace klipdot::tui
