// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace klipdot
{

/// @brief Rolling text buffer holding the most recent output of one stream.
///
/// When the content grows past the capacity, the front is discarded so that
/// only the last capacity/2 bytes remain.
class ContextBuffer
{
  public:
    static constexpr auto DefaultCapacity = std::size_t { 4096 };

    explicit ContextBuffer(std::size_t capacity = DefaultCapacity): _capacity(capacity < 2 ? 2 : capacity) {}

    void append(std::string_view line)
    {
        _text.append(line);
        _text.push_back('\n');
        _lastLine.assign(line);

        if (_text.size() > _capacity)
            _text.erase(0, _text.size() - _capacity / 2);
    }

    /// @brief The most recently appended line, without its newline.
    [[nodiscard]] auto lastLine() const noexcept -> std::string_view { return _lastLine; }

    [[nodiscard]] auto text() const noexcept -> std::string_view { return _text; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return _text.size(); }
    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return _capacity; }

    void clear()
    {
        _text.clear();
        _lastLine.clear();
    }

  private:
    std::size_t _capacity;
    std::string _text;
    std::string _lastLine;
};

} // namespace klipdot
