// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <klipdot/App.hpp>
#include <klipdot/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>
#include <optional>
#include <print>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    auto app = CLI::App { "klipdot - image interception and terminal preview" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    auto* watchCmd = app.add_subcommand("watch", "Replace clipboard images with saved file paths");

    auto previewPath = std::string {};
    auto previewWidth = 0;
    auto previewHeight = 0;
    auto* previewCmd = app.add_subcommand("preview", "Render an image in the terminal");
    previewCmd->add_option("path", previewPath, "Image file")->required();
    previewCmd->add_option("-w,--width", previewWidth, "Maximum width in cells");
    previewCmd->add_option("-H,--height", previewHeight, "Maximum height in cells");

    auto* previewStdinCmd =
        app.add_subcommand("preview-stdin", "Render image data (binary, base64, or data URI) read from stdin");

    auto monitorCommand = std::vector<std::string> {};
    auto* monitorCmd =
        app.add_subcommand("monitor-output", "Run a command (or read stdin) and preview images in its output");
    monitorCmd->add_option("command", monitorCommand, "Command and arguments (after --)");

    auto autoPreview = false;
    auto* liveCmd = app.add_subcommand("live-preview", "Preview the image path at the end of each stdin line");
    liveCmd->add_flag("--auto-preview", autoPreview, "Draw a floating preview instead of printing notices");

    auto detectPath = std::string {};
    auto* detectCmd = app.add_subcommand("detect", "Print the format and dimensions of a file");
    detectCmd->add_option("path", detectPath, "File to inspect")->required();

    auto cleanupDays = -1;
    auto* cleanupCmd = app.add_subcommand("cleanup", "Delete stored images older than N days");
    cleanupCmd->add_option("--days", cleanupDays, "Maximum age in days");

    auto* configCmd = app.add_subcommand("config", "Inspect or reset the configuration");
    configCmd->require_subcommand(1);
    auto* configShowCmd = configCmd->add_subcommand("show", "Print the effective configuration");
    auto* configPathCmd = configCmd->add_subcommand("path", "Print the config file path");
    auto* configResetCmd = configCmd->add_subcommand("reset", "Write the default configuration");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        klipdot::log::setLevel(klipdot::log::Level::Debug);

    auto const effectiveConfigPath = configPath.empty() ? klipdot::defaultConfigPath() : configPath;

    if (*configPathCmd)
    {
        std::println("{}", effectiveConfigPath);
        return 0;
    }

    if (*configResetCmd)
    {
        if (auto saved = klipdot::saveConfigToFile(effectiveConfigPath, klipdot::AppConfig {}); !saved)
        {
            klipdot::log::error("Failed to write config: {}", saved.error().message);
            return 1;
        }
        std::println("Wrote default configuration to {}", effectiveConfigPath);
        return 0;
    }

    // Load config
    auto configResult = configPath.empty() ? klipdot::loadConfig() : klipdot::loadConfigFromFile(configPath);

    if (!configResult)
    {
        klipdot::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    if (*configShowCmd)
    {
        std::println("{}", klipdot::configToJson(config));
        return 0;
    }

    auto application = klipdot::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        klipdot::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    // The command line outranks the configured log level.
    if (verbose)
        klipdot::log::setLevel(klipdot::log::Level::Debug);

    auto const optionalCells = [](int value) {
        return value > 0 ? std::optional<int> { value } : std::nullopt;
    };

    if (*watchCmd)
        return application.runWatch();
    if (*previewCmd)
        return application.runPreview(previewPath, optionalCells(previewWidth), optionalCells(previewHeight));
    if (*previewStdinCmd)
        return application.runPreviewStdin();
    if (*monitorCmd)
        return application.runMonitorOutput(monitorCommand);
    if (*liveCmd)
        return application.runLivePreview(autoPreview);
    if (*detectCmd)
        return application.runDetect(detectPath);
    if (*cleanupCmd)
        return application.runCleanup(cleanupDays >= 0 ? std::optional<int> { cleanupDays } : std::nullopt);

    return 0;
}
