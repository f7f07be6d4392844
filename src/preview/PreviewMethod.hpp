// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace klipdot
{

/// @brief Terminal graphics mechanism used for previews.
enum class PreviewKind
{
    ITerm2,   ///< OSC 1337 inline image.
    Kitty,    ///< kitty graphics protocol via `kitten icat`.
    Sixel,    ///< Sixel via `img2sixel`.
    Ascii,    ///< ASCII art helper (jp2a, img2txt).
    External, ///< Image-to-terminal helper (imgcat, catimg, timg, chafa).
    None,     ///< Text-only fallback.
};

/// @brief A selected preview method; helper-based kinds name their tool.
struct PreviewMethod
{
    PreviewKind kind = PreviewKind::None;
    std::string tool;

    [[nodiscard]] auto operator==(const PreviewMethod&) const -> bool = default;
};

/// @brief Returns "iterm2", "kitty", "sixel", "ascii(jp2a)", "external(chafa)", or "none".
[[nodiscard]] auto toString(const PreviewMethod& method) -> std::string;

/// @brief Parses a configured method name.
///
/// Accepts the plain kind names, and for helper kinds either a bare tool name
/// ("chafa", "jp2a") or the `external(tool)` / `ascii(tool)` form.
/// "auto" is not a method and yields std::nullopt.
[[nodiscard]] auto parsePreviewMethod(std::string_view name) -> std::optional<PreviewMethod>;

/// @brief Image-to-terminal helper binaries in probe order.
[[nodiscard]] auto externalPreviewTools() noexcept -> std::span<const std::string_view>;

/// @brief ASCII-art helper binaries in probe order.
[[nodiscard]] auto asciiPreviewTools() noexcept -> std::span<const std::string_view>;

} // namespace klipdot
