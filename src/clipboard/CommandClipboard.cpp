// SPDX-License-Identifier: Apache-2.0
#include "CommandClipboard.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <format>

namespace klipdot
{

namespace
{
    constexpr auto ClipboardCommandTimeout = std::chrono::milliseconds(2000);

    auto toSpec(const std::vector<std::string>& command) -> CommandSpec
    {
        return CommandSpec {
            .program = command.front(),
            .args = std::vector<std::string>(command.begin() + 1, command.end()),
            .stdinData = std::nullopt,
        };
    }

    auto findTool(std::string_view name) -> const ClipboardTool*
    {
        auto const& tools = knownClipboardTools();
        auto const it = std::ranges::find_if(
            tools, [&](const ClipboardTool& tool) { return tool.name == name || tool.probeBinary == name; });
        return it != tools.end() ? &*it : nullptr;
    }
} // namespace

auto knownClipboardTools() -> const std::vector<ClipboardTool>&
{
    static auto const tools = std::vector<ClipboardTool> {
        ClipboardTool {
            .name = "wl-clipboard",
            .probeBinary = "wl-paste",
            .readCommands = { { "wl-paste", "--no-newline", "--type", "text/plain" },
                              { "wl-paste", "--no-newline", "--type", "image/png" } },
            .writeCommand = { "wl-copy" },
        },
        ClipboardTool {
            .name = "xclip",
            .probeBinary = "xclip",
            .readCommands = { { "xclip", "-selection", "clipboard", "-o" },
                              { "xclip", "-selection", "clipboard", "-t", "image/png", "-o" } },
            .writeCommand = { "xclip", "-selection", "clipboard" },
        },
        ClipboardTool {
            .name = "xsel",
            .probeBinary = "xsel",
            .readCommands = { { "xsel", "--clipboard", "--output" } },
            .writeCommand = { "xsel", "--clipboard", "--input" },
        },
        ClipboardTool {
            .name = "pbpaste",
            .probeBinary = "pbpaste",
            .readCommands = { { "pbpaste" } },
            .writeCommand = { "pbcopy" },
        },
    };
    return tools;
}

CommandClipboard::CommandClipboard(ClipboardTool tool, CommandRunner runner):
    _tool(std::move(tool)), _runner(std::move(runner))
{
}

auto CommandClipboard::read() -> Result<std::optional<std::string>>
{
    auto lastError = std::optional<Error> {};
    auto anyRan = false;

    for (auto const& command: _tool.readCommands)
    {
        auto output = _runner(toSpec(command));
        if (!output)
        {
            lastError = output.error();
            continue;
        }
        anyRan = true;

        // Tools exit non-zero when the requested target is not available.
        if (output->exitCode == 0 && !output->stdoutData.empty())
            return std::move(output->stdoutData);
    }

    if (!anyRan && lastError)
        return makeError(ErrorCode::ClipboardError,
                         std::format("{}: clipboard read failed: {}", _tool.name, lastError->message));
    return std::nullopt;
}

auto CommandClipboard::write(std::string_view content) -> VoidResult
{
    auto spec = toSpec(_tool.writeCommand);
    spec.stdinData = std::string { content };
    // Some tools fork to own the selection and would keep captured pipes open.
    spec.discardOutput = true;

    auto output = _runner(spec);
    if (!output)
        return makeError(ErrorCode::ClipboardError,
                         std::format("{}: clipboard write failed: {}", _tool.name, output.error().message));
    if (output->exitCode != 0)
        return makeError(ErrorCode::ClipboardError,
                         std::format("{}: clipboard write exited with code {}", _tool.name, output->exitCode));
    return {};
}

auto CommandClipboard::name() const -> std::string_view
{
    return _tool.name;
}

auto ClipboardEnvironment::system() -> ClipboardEnvironment
{
    return ClipboardEnvironment {
        .getEnv = [](std::string_view name) -> std::optional<std::string> {
            auto const* value = std::getenv(std::string { name }.c_str());
            if (!value || !*value)
                return std::nullopt;
            return std::string { value };
        },
        .commandAvailable = [](std::string_view binary) { return isCommandAvailable(binary); },
    };
}

auto selectClipboardTool(std::string_view preferredTool, const ClipboardEnvironment& env) -> Result<ClipboardTool>
{
    if (!preferredTool.empty())
    {
        auto const* tool = findTool(preferredTool);
        if (!tool)
            return makeError(ErrorCode::ConfigError, std::format("Unknown clipboard tool: {}", preferredTool));
        if (env.commandAvailable(tool->probeBinary))
            return *tool;
        log::warning("Preferred clipboard tool '{}' is not installed, probing alternatives", preferredTool);
    }

    auto const sessionType = env.getEnv("XDG_SESSION_TYPE");
    auto const wayland = env.getEnv("WAYLAND_DISPLAY").has_value() || sessionType == "wayland";
    auto const x11 = env.getEnv("DISPLAY").has_value() || sessionType == "x11";

    auto order = std::vector<std::string_view> {};
    if (wayland)
        order.push_back("wl-clipboard");
    if (wayland || x11)
    {
        order.push_back("xclip");
        order.push_back("xsel");
    }
    order.push_back("pbpaste");

    for (auto const name: order)
    {
        auto const* tool = findTool(name);
        if (tool && env.commandAvailable(tool->probeBinary))
        {
            log::debug("Using clipboard tool {} (wayland={}, x11={})", tool->name, wayland, x11);
            return *tool;
        }
    }

    return makeError(ErrorCode::ClipboardError,
                     "No clipboard tool found (install wl-clipboard, xclip, or xsel)");
}

auto detectClipboardBackend(std::string_view preferredTool) -> Result<std::unique_ptr<ClipboardBackend>>
{
    auto tool = selectClipboardTool(preferredTool, ClipboardEnvironment::system());
    if (!tool)
        return std::unexpected(tool.error());

    log::info("Clipboard backend: {}", tool->name);
    return std::make_unique<CommandClipboard>(std::move(*tool), systemCommandRunner(ClipboardCommandTimeout));
}

} // namespace klipdot
