// SPDX-License-Identifier: Apache-2.0
#include "LiveCursorTracker.hpp"

#include <core/Log.hpp>

#include <format>

namespace klipdot
{

namespace
{
    auto isDelimiter(char c) noexcept -> bool
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '"' || c == '\'';
    }
} // namespace

FloatingPreview::FloatingPreview(PreviewRenderer& renderer, tui::TerminalOutput& output):
    _renderer(renderer), _output(output)
{
}

auto FloatingPreview::show(const std::filesystem::path& path) -> VoidResult
{
    _output.saveCursor();
    _output.moveTo(1, 1);
    _output.clearLine();
    _output.write(std::format("Preview: {}", path.filename().string()),
                  tui::Style { .fg = std::nullopt, .bold = true, .dim = false });
    _output.writeRaw("\n");
    _output.flush();

    auto rendered = _renderer.render(path, Width, Height);

    _output.restoreCursor();
    _output.flush();
    return rendered;
}

auto FloatingPreview::hide() -> VoidResult
{
    _output.saveCursor();
    for (auto row = 1; row <= Height + 1; ++row)
    {
        _output.moveTo(row, 1);
        _output.clearToEndOfLine();
    }
    _output.restoreCursor();
    _output.flush();
    return {};
}

LiveCursorTracker::LiveCursorTracker(const ReferenceScanner& scanner, PreviewSurface& surface):
    _scanner(scanner), _surface(surface)
{
}

auto LiveCursorTracker::tokenAt(std::string_view text, std::size_t cursor) -> std::string_view
{
    if (cursor > text.size())
        cursor = text.size();

    auto start = cursor;
    while (start > 0 && !isDelimiter(text[start - 1]))
        --start;
    auto end = cursor;
    while (end < text.size() && !isDelimiter(text[end]))
        ++end;
    return text.substr(start, end - start);
}

auto LiveCursorTracker::candidatePath(std::string_view token) const -> std::optional<std::filesystem::path>
{
    if (token.empty() || !hasImageExtension(token))
        return std::nullopt;

    auto path = _scanner.resolvePath(token);
    auto ec = std::error_code {};
    if (!std::filesystem::is_regular_file(path, ec))
        return std::nullopt;
    return path;
}

auto LiveCursorTracker::update(std::string_view text, std::size_t cursor) -> Result<bool>
{
    auto const candidate = candidatePath(tokenAt(text, cursor));
    if (candidate == _shown)
        return false;

    if (candidate)
    {
        log::debug("Live preview: {}", candidate->string());
        // The slot tracks the requested path even if drawing fails.
        _shown = candidate;
        if (auto shown = _surface.show(*candidate); !shown)
            return std::unexpected(shown.error());
        return true;
    }

    _shown.reset();
    if (auto hidden = _surface.hide(); !hidden)
        return std::unexpected(hidden.error());
    return true;
}

auto LiveCursorTracker::clear() -> VoidResult
{
    if (!_shown)
        return {};
    _shown.reset();
    return _surface.hide();
}

} // namespace klipdot
