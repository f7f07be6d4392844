// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace klipdot::tui
{

/// @brief Text styling attributes for terminal output.
struct Style
{
    std::optional<std::uint8_t> fg; ///< 256-color foreground index.
    bool bold = false;              ///< Bold text.
    bool dim = false;               ///< Dim/faint text.
};

/// @brief Buffered terminal writer for preview output and cursor control.
///
/// Output is collected in an internal buffer and handed to the sink on
/// flush(). The default sink writes to STDOUT.
class TerminalOutput
{
  public:
    TerminalOutput();
    explicit TerminalOutput(OutputSink sink);

    /// @brief Queries terminal dimensions.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Writes styled text at the current cursor position.
    void write(std::string_view text, Style const& style = {});

    /// @brief Writes raw bytes (escape sequences, helper output) without styling.
    void writeRaw(std::string_view text);

    /// @brief Writes text followed by a newline.
    void writeLine(std::string_view text, Style const& style = {});

    /// @brief Moves the cursor to an absolute position (1-based).
    void moveTo(int row, int col);

    /// @brief Clears the entire current line.
    void clearLine();

    /// @brief Clears from cursor to end of line.
    void clearToEndOfLine();

    /// @brief Saves the cursor position (ESC 7).
    void saveCursor();

    /// @brief Restores the cursor position (ESC 8).
    void restoreCursor();

    /// @brief Hands the buffered output to the sink.
    void flush();

    /// @brief Returns the terminal width in columns.
    [[nodiscard]] auto columns() const noexcept -> int;

    /// @brief Returns the terminal height in rows.
    [[nodiscard]] auto rows() const noexcept -> int;

    /// @brief Updates the cached terminal dimensions.
    void updateDimensions();

  private:
    OutputSink _sink;
    std::string _buffer; ///< Output buffer for batching writes.
    int _cols = 80;
    int _rows = 24;

    void appendSgr(Style const& style);
};

} // namespace klipdot::tui
