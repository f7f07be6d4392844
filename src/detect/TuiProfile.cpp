// SPDX-License-Identifier: Apache-2.0
#include "TuiProfile.hpp"

#include <array>

namespace klipdot
{

namespace
{
    // clang-format off
    constexpr auto Profiles = std::array {
        TuiProfile { "vim",    "Vim",    false, PreviewDispatch::External,     ScanStrategy::Editor },
        TuiProfile { "nvim",   "Neovim", true,  PreviewDispatch::Overlay,      ScanStrategy::Editor },
        TuiProfile { "ranger", "Ranger", true,  PreviewDispatch::SeparatePane, ScanStrategy::FileManager },
        TuiProfile { "lf",     "LF",     true,  PreviewDispatch::SeparatePane, ScanStrategy::FileManager },
        TuiProfile { "nnn",    "NNN",    true,  PreviewDispatch::External,     ScanStrategy::FileManager },
        TuiProfile { "w3m",    "w3m",    true,  PreviewDispatch::Inline,       ScanStrategy::Browser },
        TuiProfile { "lynx",   "Lynx",   false, PreviewDispatch::External,     ScanStrategy::Default },
        TuiProfile { "tmux",   "Tmux",   true,  PreviewDispatch::SeparatePane, ScanStrategy::Default },
        TuiProfile { "screen", "Screen", false, PreviewDispatch::External,     ScanStrategy::Default },
        TuiProfile { "tig",    "Tig",    false, PreviewDispatch::External,     ScanStrategy::Default },
        TuiProfile { "gitui",  "GitUI",  false, PreviewDispatch::External,     ScanStrategy::Default },
        TuiProfile { "htop",   "htop",   false, PreviewDispatch::None,         ScanStrategy::Default },
        TuiProfile { "btop",   "btop",   false, PreviewDispatch::None,         ScanStrategy::Default },
    };
    // clang-format on
} // namespace

auto lookupTuiProfile(std::string_view command) noexcept -> const TuiProfile*
{
    if (auto const slash = command.rfind('/'); slash != std::string_view::npos)
        command.remove_prefix(slash + 1);

    for (auto const& profile: Profiles)
    {
        if (profile.binary == command)
            return &profile;
    }
    return nullptr;
}

} // namespace klipdot
