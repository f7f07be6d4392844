// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <klipdot/Config.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace klipdot
{

/// @brief Wires configuration, detection, storage, and preview for each command.
///
/// Every run* method returns the process exit code.
class App
{
  public:
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Applies the configured log level and validates the configuration.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Watches the clipboard in the foreground until SIGINT or SIGTERM.
    [[nodiscard]] auto runWatch() -> int;

    /// @brief Renders one image file.
    [[nodiscard]] auto runPreview(const std::string& path, std::optional<int> width, std::optional<int> height) -> int;

    /// @brief Renders image data (binary, base64, or data URI) read from stdin.
    [[nodiscard]] auto runPreviewStdin() -> int;

    /// @brief Runs @p command under the stream monitor, or monitors stdin if empty.
    [[nodiscard]] auto runMonitorOutput(const std::vector<std::string>& command) -> int;

    /// @brief Feeds stdin lines to the live cursor tracker, cursor at end of line.
    [[nodiscard]] auto runLivePreview(bool autoPreview) -> int;

    /// @brief Prints the sniffed format and header dimensions of a file.
    [[nodiscard]] auto runDetect(const std::string& path) -> int;

    /// @brief Removes stored images older than @p days (configured default if unset).
    [[nodiscard]] auto runCleanup(std::optional<int> days) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace klipdot
