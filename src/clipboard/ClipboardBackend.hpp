// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace klipdot
{

/// @brief Abstract access to the system clipboard.
///
/// One implementation is selected at startup; the rest of the pipeline only
/// sees this interface.
class ClipboardBackend
{
  public:
    virtual ~ClipboardBackend() = default;

    /// @brief Reads the current clipboard content.
    /// @return The content, std::nullopt if the clipboard is empty, or an error.
    [[nodiscard]] virtual auto read() -> Result<std::optional<std::string>> = 0;

    /// @brief Replaces the clipboard content with @p content.
    [[nodiscard]] virtual auto write(std::string_view content) -> VoidResult = 0;

    /// @brief Human-readable backend name for logs.
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

} // namespace klipdot
