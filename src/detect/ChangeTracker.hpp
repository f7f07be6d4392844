// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <utility>

namespace klipdot
{

/// @brief Single-slot memory of the last value seen from one source.
///
/// Owned by the loop driving that source; not safe for concurrent writers.
template <typename T>
class ChangeTracker
{
  public:
    /// @brief Records @p value and reports whether it differs from the previous observation.
    /// @return true on the first observation and whenever the value changed.
    [[nodiscard]] auto observe(T value) -> bool
    {
        if (_last && *_last == value)
            return false;
        _last = std::move(value);
        return true;
    }

    /// @brief Overwrites the slot without reporting a change.
    void remember(T value) { _last = std::move(value); }

    [[nodiscard]] auto last() const noexcept -> const std::optional<T>& { return _last; }

    void reset() noexcept { _last.reset(); }

  private:
    std::optional<T> _last;
};

} // namespace klipdot
