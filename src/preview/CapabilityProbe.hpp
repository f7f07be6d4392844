// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <preview/PreviewMethod.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace klipdot
{

/// @brief The signals consulted when choosing a preview method.
struct ProbeEnvironment
{
    std::function<std::optional<std::string>(std::string_view name)> getEnv;
    std::function<bool()> querySixel;
    std::function<bool(std::string_view binary)> commandAvailable;

    /// @brief Reads the real environment, terminal, and PATH.
    [[nodiscard]] static auto system(std::chrono::milliseconds sixelTimeout) -> ProbeEnvironment;
};

/// @brief Picks the preview method once, in fixed priority order.
///
/// iTerm2 (TERM_PROGRAM=iTerm.app) > Kitty (TERM contains "kitty" or
/// KITTY_WINDOW_ID is set) > Sixel (DA1 reply) > external helpers > ASCII
/// helpers > None. The Kitty method also requires the `kitten` helper; the
/// Sixel method requires `img2sixel`.
[[nodiscard]] auto detectPreviewMethod(const ProbeEnvironment& env) -> PreviewMethod;

} // namespace klipdot
