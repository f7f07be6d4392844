// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string_view>

namespace klipdot
{

/// @brief How detections from a host application are presented.
enum class PreviewDispatch
{
    Inline,       ///< Draw the preview in the output flow.
    SeparatePane, ///< The host has its own pane; only announce the detection.
    Overlay,      ///< Draw a large preview on top of the host's screen.
    External,     ///< Suggest an external viewer.
    None,         ///< Log only.
};

/// @brief Which scanning rules apply to a host application's output.
enum class ScanStrategy
{
    Default,
    FileManager, ///< Also accepts bare file names relative to the working directory.
    Editor,
    Browser, ///< Also joins wrapped lines to recover URLs.
};

/// @brief Static description of a known terminal application.
struct TuiProfile
{
    std::string_view binary;
    std::string_view name;
    bool supportsImages = false;
    PreviewDispatch dispatch = PreviewDispatch::None;
    ScanStrategy strategy = ScanStrategy::Default;
};

/// @brief Looks up the profile for a command by the basename of its binary.
/// @return The profile, or nullptr for unknown commands.
[[nodiscard]] auto lookupTuiProfile(std::string_view command) noexcept -> const TuiProfile*;

[[nodiscard]] constexpr auto dispatchName(PreviewDispatch dispatch) -> std::string_view
{
    switch (dispatch)
    {
        case PreviewDispatch::Inline: return "inline";
        case PreviewDispatch::SeparatePane: return "separate-pane";
        case PreviewDispatch::Overlay: return "overlay";
        case PreviewDispatch::External: return "external";
        case PreviewDispatch::None: return "none";
    }
    return "none";
}

} // namespace klipdot
