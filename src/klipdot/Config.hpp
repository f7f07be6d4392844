// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace klipdot
{

/// @brief Which sources are intercepted.
struct InterceptConfig
{
    bool clipboard = true;
    bool stream = true;
    bool stdinPipe = true;
};

/// @brief Preview configuration section.
struct PreviewConfig
{
    bool enabled = true;

    /// @brief "auto" to probe the terminal, or a fixed method such as "kitty" or "chafa".
    std::string method = "auto";

    int maxWidth = 40;
    int maxHeight = 20;

    /// @brief How long to wait for the sixel device-attributes reply.
    int sixelTimeoutMs = 200;
};

/// @brief Clipboard configuration section.
struct ClipboardConfig
{
    /// @brief Tool to use ("wl-clipboard", "xclip", "xsel", "pbpaste"); empty probes.
    std::string preferredTool;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    std::string screenshotDir; ///< Empty means defaultScreenshotDir().
    int pollInterval = 1000;   ///< Milliseconds between clipboard ticks.
    std::uint64_t maxFileSize = 10 * 1024 * 1024;
    int cleanupDays = 30;
    std::string logLevel = "info";
    InterceptConfig intercept;
    PreviewConfig preview;
    ClipboardConfig clipboard;

    /// @brief screenshotDir, or the default when unset.
    [[nodiscard]] auto effectiveScreenshotDir() const -> std::string;
};

/// @brief Loads the application configuration from the default config path.
///
/// A missing file yields the defaults.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @return The configuration, or ConfigError if the file cannot be read or parsed.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating parent directories.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Serializes a configuration to its JSON text.
[[nodiscard]] auto configToJson(const AppConfig& config) -> std::string;

/// @brief Returns the default config directory path for the current platform.
/// On Linux: $XDG_CONFIG_HOME/klipdot or ~/.config/klipdot
/// On macOS: ~/Library/Application Support/klipdot
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns ~/.klipdot/screenshots.
[[nodiscard]] auto defaultScreenshotDir() -> std::string;

} // namespace klipdot
