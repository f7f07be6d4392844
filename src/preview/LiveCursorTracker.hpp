// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <detect/ReferenceScanner.hpp>
#include <preview/PreviewRenderer.hpp>
#include <tui/TerminalOutput.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string_view>

namespace klipdot
{

/// @brief Where the live preview is drawn.
class PreviewSurface
{
  public:
    virtual ~PreviewSurface() = default;

    /// @brief Shows @p path, replacing any preview currently visible.
    [[nodiscard]] virtual auto show(const std::filesystem::path& path) -> VoidResult = 0;

    /// @brief Removes the visible preview.
    [[nodiscard]] virtual auto hide() -> VoidResult = 0;
};

/// @brief Draws a small preview in the top rows of the screen and restores the cursor.
class FloatingPreview: public PreviewSurface
{
  public:
    static constexpr auto Width = 40;
    static constexpr auto Height = 10;

    FloatingPreview(PreviewRenderer& renderer, tui::TerminalOutput& output);

    [[nodiscard]] auto show(const std::filesystem::path& path) -> VoidResult override;
    [[nodiscard]] auto hide() -> VoidResult override;

  private:
    PreviewRenderer& _renderer;
    tui::TerminalOutput& _output;
};

/// @brief Shows a preview while the cursor sits on an image path.
///
/// Keeps a single slot with the path currently shown; at most one preview is
/// visible at a time.
class LiveCursorTracker
{
  public:
    LiveCursorTracker(const ReferenceScanner& scanner, PreviewSurface& surface);

    /// @brief Re-evaluates the token under @p cursor.
    /// @return true if the preview appeared, changed, or disappeared.
    [[nodiscard]] auto update(std::string_view text, std::size_t cursor) -> Result<bool>;

    /// @brief Hides any visible preview.
    [[nodiscard]] auto clear() -> VoidResult;

    [[nodiscard]] auto current() const noexcept -> const std::optional<std::filesystem::path>& { return _shown; }

    /// @brief Returns the whitespace/quote-delimited token containing @p cursor.
    ///
    /// A cursor right after the last character of a token still selects it.
    [[nodiscard]] static auto tokenAt(std::string_view text, std::size_t cursor) -> std::string_view;

    /// @brief Resolves @p token to an existing file with an image extension.
    ///
    /// Only the extension is checked, not the file's signature.
    [[nodiscard]] auto candidatePath(std::string_view token) const -> std::optional<std::filesystem::path>;

  private:
    const ReferenceScanner& _scanner;
    PreviewSurface& _surface;
    std::optional<std::filesystem::path> _shown;
};

} // namespace klipdot
