// SPDX-License-Identifier: Apache-2.0
#include <sys/ioctl.h>

#include <format>

#include <unistd.h>

#include <core/FdIo.hpp>
#include <tui/TerminalOutput.hpp>

namespace klipdot::tui
{

TerminalOutput::TerminalOutput(): _sink(makeFdSink(STDOUT_FILENO))
{
}

TerminalOutput::TerminalOutput(OutputSink sink): _sink(std::move(sink))
{
}

auto TerminalOutput::initialize() -> VoidResult
{
    updateDimensions();
    return {};
}

void TerminalOutput::write(std::string_view text, Style const& style)
{
    appendSgr(style);
    _buffer.append(text);
    if (style.fg || style.bold || style.dim)
        _buffer += "\033[m";
}

void TerminalOutput::writeRaw(std::string_view text)
{
    _buffer.append(text);
}

void TerminalOutput::writeLine(std::string_view text, Style const& style)
{
    write(text, style);
    _buffer += "\n";
}

void TerminalOutput::moveTo(int row, int col)
{
    _buffer += std::format("\033[{};{}H", row, col);
}

void TerminalOutput::clearLine()
{
    _buffer += "\033[2K";
}

void TerminalOutput::clearToEndOfLine()
{
    _buffer += "\033[K";
}

void TerminalOutput::saveCursor()
{
    _buffer += "\0337";
}

void TerminalOutput::restoreCursor()
{
    _buffer += "\0338";
}

void TerminalOutput::flush()
{
    if (!_buffer.empty())
    {
        if (_sink)
            _sink(_buffer);
        _buffer.clear();
    }
}

auto TerminalOutput::columns() const noexcept -> int
{
    return _cols;
}

auto TerminalOutput::rows() const noexcept -> int
{
    return _rows;
}

void TerminalOutput::updateDimensions()
{
    auto ws = winsize {};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0)
    {
        _cols = ws.ws_col;
        _rows = ws.ws_row;
    }
}

void TerminalOutput::appendSgr(Style const& style)
{
    if (!style.fg && !style.bold && !style.dim)
        return;

    _buffer += "\033[";
    auto needSemicolon = false;
    auto const appendSep = [&]() {
        if (needSemicolon)
            _buffer += ';';
        needSemicolon = true;
    };

    if (style.bold)
    {
        appendSep();
        _buffer += '1';
    }
    if (style.dim)
    {
        appendSep();
        _buffer += '2';
    }
    if (style.fg)
    {
        appendSep();
        _buffer += std::format("38;5;{}", *style.fg);
    }

    _buffer += 'm';
}

} // namespace klipdot::tui
