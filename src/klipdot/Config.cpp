// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace klipdot
{

namespace
{
    auto homeDir() -> std::string
    {
        auto const* const home = std::getenv("HOME");
        return home ? std::string(home) : std::string(".");
    }

    auto toJson(const AppConfig& config) -> nlohmann::json
    {
        auto root = nlohmann::json::object();
        if (!config.screenshotDir.empty())
            root["screenshotDir"] = config.screenshotDir;
        root["pollInterval"] = config.pollInterval;
        root["maxFileSize"] = config.maxFileSize;
        root["cleanupDays"] = config.cleanupDays;
        root["logLevel"] = config.logLevel;

        // Intercept section
        auto intercept = nlohmann::json::object();
        intercept["clipboard"] = config.intercept.clipboard;
        intercept["stream"] = config.intercept.stream;
        intercept["stdin"] = config.intercept.stdinPipe;
        root["intercept"] = std::move(intercept);

        // Preview section
        auto preview = nlohmann::json::object();
        preview["enabled"] = config.preview.enabled;
        preview["method"] = config.preview.method;
        preview["maxWidth"] = config.preview.maxWidth;
        preview["maxHeight"] = config.preview.maxHeight;
        preview["sixelTimeoutMs"] = config.preview.sixelTimeoutMs;
        root["preview"] = std::move(preview);

        // Clipboard section
        auto clipboard = nlohmann::json::object();
        if (!config.clipboard.preferredTool.empty())
            clipboard["preferredTool"] = config.clipboard.preferredTool;
        root["clipboard"] = std::move(clipboard);

        return root;
    }
} // namespace

auto AppConfig::effectiveScreenshotDir() const -> std::string
{
    if (screenshotDir.empty())
        return defaultScreenshotDir();
    if (screenshotDir.starts_with("~/"))
        return homeDir() + screenshotDir.substr(1);
    return screenshotDir;
}

auto defaultConfigDir() -> std::string
{
#if defined(__APPLE__)
    return homeDir() + "/Library/Application Support/klipdot";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/klipdot";
    return homeDir() + "/.config/klipdot";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto defaultScreenshotDir() -> std::string
{
    return homeDir() + "/.klipdot/screenshots";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} is not a JSON object", path));

    auto const defaults = AppConfig {};
    auto config = AppConfig {};

    config.screenshotDir = json::getStringOr(root, "screenshotDir", "");
    config.pollInterval = json::getIntOr(root, "pollInterval", defaults.pollInterval);
    config.maxFileSize = json::getUint64Or(root, "maxFileSize", defaults.maxFileSize);
    config.cleanupDays = json::getIntOr(root, "cleanupDays", defaults.cleanupDays);
    config.logLevel = json::getStringOr(root, "logLevel", defaults.logLevel);

    // Intercept section
    auto const intercept = json::sectionOf(root, "intercept");
    config.intercept.clipboard = json::getBoolOr(intercept, "clipboard", true);
    config.intercept.stream = json::getBoolOr(intercept, "stream", true);
    config.intercept.stdinPipe = json::getBoolOr(intercept, "stdin", true);

    // Preview section
    auto const preview = json::sectionOf(root, "preview");
    config.preview.enabled = json::getBoolOr(preview, "enabled", defaults.preview.enabled);
    config.preview.method = json::getStringOr(preview, "method", defaults.preview.method);
    config.preview.maxWidth = json::getIntOr(preview, "maxWidth", defaults.preview.maxWidth);
    config.preview.maxHeight = json::getIntOr(preview, "maxHeight", defaults.preview.maxHeight);
    config.preview.sixelTimeoutMs = json::getIntOr(preview, "sixelTimeoutMs", defaults.preview.sixelTimeoutMs);

    // Clipboard section
    auto const clipboard = json::sectionOf(root, "clipboard");
    config.clipboard.preferredTool = json::getStringOr(clipboard, "preferredTool", "");

    if (config.pollInterval <= 0)
        return makeError(ErrorCode::ConfigError,
                         std::format("pollInterval must be positive, got {}", config.pollInterval));
    if (config.cleanupDays < 0)
        return makeError(ErrorCode::ConfigError,
                         std::format("cleanupDays must not be negative, got {}", config.cleanupDays));
    if (config.preview.maxWidth <= 0 || config.preview.maxHeight <= 0)
        return makeError(ErrorCode::ConfigError, "preview.maxWidth and preview.maxHeight must be positive");

    return config;
}

auto configToJson(const AppConfig& config) -> std::string
{
    return toJson(config).dump(4);
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << configToJson(config) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::debug("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace klipdot
