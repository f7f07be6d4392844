// SPDX-License-Identifier: Apache-2.0
#include "CapabilityProbe.hpp"

#include <core/Log.hpp>
#include <core/Subprocess.hpp>
#include <tui/DeviceAttributes.hpp>

#include <cstdlib>

namespace klipdot
{

auto ProbeEnvironment::system(std::chrono::milliseconds sixelTimeout) -> ProbeEnvironment
{
    return ProbeEnvironment {
        .getEnv = [](std::string_view name) -> std::optional<std::string> {
            auto const* value = std::getenv(std::string { name }.c_str());
            if (!value)
                return std::nullopt;
            return std::string { value };
        },
        .querySixel = [sixelTimeout]() { return tui::querySixelSupport(sixelTimeout); },
        .commandAvailable = [](std::string_view binary) { return isCommandAvailable(binary); },
    };
}

auto detectPreviewMethod(const ProbeEnvironment& env) -> PreviewMethod
{
    if (env.getEnv("TERM_PROGRAM") == "iTerm.app")
    {
        log::debug("Preview probe: iTerm2 detected via TERM_PROGRAM");
        return PreviewMethod { .kind = PreviewKind::ITerm2, .tool = {} };
    }

    auto const term = env.getEnv("TERM").value_or("");
    if (term.find("kitty") != std::string::npos || env.getEnv("KITTY_WINDOW_ID"))
    {
        if (env.commandAvailable("kitten"))
        {
            log::debug("Preview probe: kitty detected (TERM={})", term);
            return PreviewMethod { .kind = PreviewKind::Kitty, .tool = "kitten" };
        }
        log::debug("Preview probe: kitty terminal without the kitten helper");
    }

    if (env.commandAvailable("img2sixel") && env.querySixel())
    {
        log::debug("Preview probe: sixel advertised in device attributes");
        return PreviewMethod { .kind = PreviewKind::Sixel, .tool = "img2sixel" };
    }

    for (auto const tool: externalPreviewTools())
    {
        if (env.commandAvailable(tool))
            return PreviewMethod { .kind = PreviewKind::External, .tool = std::string { tool } };
    }

    for (auto const tool: asciiPreviewTools())
    {
        if (env.commandAvailable(tool))
            return PreviewMethod { .kind = PreviewKind::Ascii, .tool = std::string { tool } };
    }

    log::debug("Preview probe: no graphics capability, using text fallback");
    return PreviewMethod { .kind = PreviewKind::None, .tool = {} };
}

} // namespace klipdot
