// SPDX-License-Identifier: Apache-2.0
#include "PreviewMethod.hpp"

#include <array>
#include <format>
#include <utility>

namespace klipdot
{

namespace
{
    constexpr auto ExternalTools = std::array<std::string_view, 4> { "imgcat", "catimg", "timg", "chafa" };
    constexpr auto AsciiTools = std::array<std::string_view, 2> { "jp2a", "img2txt" };

    auto contains(auto const& list, std::string_view name) -> bool
    {
        for (auto const entry: list)
        {
            if (entry == name)
                return true;
        }
        return false;
    }

    /// Splits "kind(tool)" into kind and tool.
    auto splitCall(std::string_view name) -> std::pair<std::string_view, std::string_view>
    {
        auto const open = name.find('(');
        if (open == std::string_view::npos || !name.ends_with(')'))
            return { name, {} };
        return { name.substr(0, open), name.substr(open + 1, name.size() - open - 2) };
    }
} // namespace

auto externalPreviewTools() noexcept -> std::span<const std::string_view>
{
    return ExternalTools;
}

auto asciiPreviewTools() noexcept -> std::span<const std::string_view>
{
    return AsciiTools;
}

auto toString(const PreviewMethod& method) -> std::string
{
    switch (method.kind)
    {
        case PreviewKind::ITerm2: return "iterm2";
        case PreviewKind::Kitty: return "kitty";
        case PreviewKind::Sixel: return "sixel";
        case PreviewKind::Ascii: return std::format("ascii({})", method.tool);
        case PreviewKind::External: return std::format("external({})", method.tool);
        case PreviewKind::None: return "none";
    }
    return "none";
}

auto parsePreviewMethod(std::string_view name) -> std::optional<PreviewMethod>
{
    if (name == "iterm2")
        return PreviewMethod { .kind = PreviewKind::ITerm2, .tool = {} };
    if (name == "kitty")
        return PreviewMethod { .kind = PreviewKind::Kitty, .tool = {} };
    if (name == "sixel")
        return PreviewMethod { .kind = PreviewKind::Sixel, .tool = {} };
    if (name == "none")
        return PreviewMethod { .kind = PreviewKind::None, .tool = {} };

    auto const [kind, tool] = splitCall(name);
    if (kind == "external" && contains(ExternalTools, tool))
        return PreviewMethod { .kind = PreviewKind::External, .tool = std::string { tool } };
    if (kind == "ascii" && contains(AsciiTools, tool))
        return PreviewMethod { .kind = PreviewKind::Ascii, .tool = std::string { tool } };
    if (tool.empty() && contains(ExternalTools, name))
        return PreviewMethod { .kind = PreviewKind::External, .tool = std::string { name } };
    if (tool.empty() && contains(AsciiTools, name))
        return PreviewMethod { .kind = PreviewKind::Ascii, .tool = std::string { name } };

    return std::nullopt;
}

} // namespace klipdot
