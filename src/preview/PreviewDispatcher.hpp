// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <detect/TuiProfile.hpp>
#include <preview/PreviewRenderer.hpp>
#include <store/ImageStore.hpp>
#include <tui/TerminalOutput.hpp>

#include <filesystem>
#include <optional>

namespace klipdot
{

/// @brief Preview bounds in terminal cells.
struct PreviewSize
{
    int width = DefaultPreviewWidth;
    int height = DefaultPreviewHeight;
};

constexpr auto InlinePreviewSize = PreviewSize { .width = 60, .height = 30 };
constexpr auto OverlayPreviewSize = PreviewSize { .width = 80, .height = 40 };

/// @brief Turns stream detections into previews according to the host profile.
///
/// Base64 detections are decoded and stored first; URL detections are only
/// logged. Render failures are logged and replaced by the text summary so
/// monitoring is never interrupted.
class PreviewDispatcher
{
  public:
    /// @param store Where inline payloads are written; nullptr skips them.
    /// @param profile Host application, or nullptr for plain command output.
    PreviewDispatcher(PreviewRenderer& renderer,
                      tui::TerminalOutput& output,
                      ImageStore* store,
                      const TuiProfile* profile,
                      bool previewEnabled);

    /// @brief Handles one detection. Never fails.
    void handle(const DetectedImage& detection);

    /// @brief Maps a detection to a local image file.
    /// @return The file, std::nullopt for references that have none (URLs,
    ///         undecodable payloads), or an error from decoding or storing.
    [[nodiscard]] auto resolve(const DetectedImage& detection) -> Result<std::optional<std::filesystem::path>>;

  private:
    void present(const std::filesystem::path& path);
    void renderOrDescribe(const std::filesystem::path& path, PreviewSize size);
    void notice(std::string_view message);

    PreviewRenderer& _renderer;
    tui::TerminalOutput& _output;
    ImageStore* _store;
    const TuiProfile* _profile;
    bool _previewEnabled;
};

} // namespace klipdot
