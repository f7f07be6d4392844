// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <clipboard/ClipboardBackend.hpp>
#include <core/Subprocess.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace klipdot
{

/// @brief Command lines used by one clipboard tool family.
struct ClipboardTool
{
    std::string_view name;        ///< e.g. "wl-clipboard", "xclip"
    std::string_view probeBinary; ///< Binary checked on PATH.
    std::vector<std::vector<std::string>> readCommands; ///< Tried in order until one yields content.
    std::vector<std::string> writeCommand;
};

/// @brief Returns the known clipboard tool families.
[[nodiscard]] auto knownClipboardTools() -> const std::vector<ClipboardTool>&;

/// @brief ClipboardBackend that shells out to a clipboard tool.
class CommandClipboard: public ClipboardBackend
{
  public:
    /// @param runner Runs read commands and captures their output.
    explicit CommandClipboard(ClipboardTool tool, CommandRunner runner = systemCommandRunner());

    [[nodiscard]] auto read() -> Result<std::optional<std::string>> override;
    [[nodiscard]] auto write(std::string_view content) -> VoidResult override;
    [[nodiscard]] auto name() const -> std::string_view override;

  private:
    ClipboardTool _tool;
    CommandRunner _runner;
};

/// @brief Inputs to clipboard backend selection; defaults query the real system.
struct ClipboardEnvironment
{
    std::function<std::optional<std::string>(std::string_view name)> getEnv;
    std::function<bool(std::string_view binary)> commandAvailable;

    [[nodiscard]] static auto system() -> ClipboardEnvironment;
};

/// @brief Picks a clipboard tool.
///
/// A configured @p preferredTool wins if it is installed. Otherwise the display
/// server decides: Wayland prefers wl-clipboard, X11 prefers xclip then xsel,
/// and macOS tools are used when present.
[[nodiscard]] auto selectClipboardTool(std::string_view preferredTool, const ClipboardEnvironment& env)
    -> Result<ClipboardTool>;

/// @brief Selects a tool with the system environment and wraps it in a CommandClipboard.
[[nodiscard]] auto detectClipboardBackend(std::string_view preferredTool) -> Result<std::unique_ptr<ClipboardBackend>>;

} // namespace klipdot
