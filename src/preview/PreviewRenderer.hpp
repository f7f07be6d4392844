// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Subprocess.hpp>
#include <core/Types.hpp>
#include <preview/PreviewMethod.hpp>
#include <tui/TerminalOutput.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace klipdot
{

/// @brief Preview size used when the caller gives no bounds, in terminal cells.
constexpr auto DefaultPreviewWidth = 40;
constexpr auto DefaultPreviewHeight = 20;

/// @brief Draws images with one fixed preview method.
///
/// The method is chosen once by the caller (see detectPreviewMethod) and
/// never changes. A failure of that method is returned to the caller; it is
/// not retried with a different method.
class PreviewRenderer
{
  public:
    PreviewRenderer(PreviewMethod method, tui::TerminalOutput& output, CommandRunner runner = systemCommandRunner());

    /// @brief Renders @p path within the given bounds (terminal cells).
    ///
    /// With PreviewKind::None the text summary is printed instead.
    /// @return IoError if the file is missing, RenderError if the method fails.
    [[nodiscard]] auto render(const std::filesystem::path& path,
                              std::optional<int> maxWidth = std::nullopt,
                              std::optional<int> maxHeight = std::nullopt) -> VoidResult;

    /// @brief Prints filename, size, dimensions, and path as text.
    [[nodiscard]] auto renderTextInfo(const std::filesystem::path& path) -> VoidResult;

    [[nodiscard]] auto method() const noexcept -> const PreviewMethod& { return _method; }

    /// @brief Builds the iTerm2 OSC 1337 inline-image sequence for @p bytes.
    [[nodiscard]] static auto encodeITerm2(std::span<const std::uint8_t> bytes,
                                           std::string_view filename,
                                           int width,
                                           int height) -> std::string;

    /// @brief Translates a helper-based method and bounds into that helper's command line.
    /// @return UnsupportedMethod for methods that do not use a helper.
    [[nodiscard]] static auto buildHelperCommand(const PreviewMethod& method,
                                                 const std::filesystem::path& path,
                                                 int width,
                                                 int height) -> Result<CommandSpec>;

  private:
    auto renderITerm2(const std::filesystem::path& path, int width, int height) -> VoidResult;
    auto renderWithHelper(const std::filesystem::path& path, int width, int height) -> VoidResult;

    PreviewMethod _method;
    tui::TerminalOutput& _output;
    CommandRunner _runner;
};

/// @brief One-line summary "name (WxH) - size" used by compact dispatch.
[[nodiscard]] auto compactImageInfo(const std::filesystem::path& path) -> Result<std::string>;

} // namespace klipdot
