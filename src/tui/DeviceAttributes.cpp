// SPDX-License-Identifier: Apache-2.0
#include "DeviceAttributes.hpp"

#include <core/FdIo.hpp>
#include <core/Log.hpp>

#include <array>
#include <charconv>

#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace klipdot::tui
{

namespace
{
    constexpr auto PrimaryDeviceAttributes = std::string_view { "\033[c" };

    /// Restores the saved terminal mode on scope exit.
    class RawModeGuard
    {
      public:
        explicit RawModeGuard(int fd): _fd(fd)
        {
            if (tcgetattr(_fd, &_orig) != 0)
                return;
            auto raw = _orig;
            raw.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO);
            raw.c_cc[VMIN] = 0;
            raw.c_cc[VTIME] = 0;
            _active = tcsetattr(_fd, TCSANOW, &raw) == 0;
        }

        ~RawModeGuard()
        {
            if (_active)
                tcsetattr(_fd, TCSANOW, &_orig);
        }

        RawModeGuard(RawModeGuard const&) = delete;
        auto operator=(RawModeGuard const&) -> RawModeGuard& = delete;

        [[nodiscard]] auto active() const noexcept -> bool { return _active; }

      private:
        int _fd;
        termios _orig {};
        bool _active = false;
    };
    auto isCompleteReply(std::string_view reply) -> bool
    {
        auto const start = reply.find("\033[?");
        return start != std::string_view::npos && reply.find('c', start) != std::string_view::npos;
    }
} // namespace

auto parseDeviceAttributes(std::string_view reply) -> std::vector<int>
{
    auto const start = reply.find("\033[?");
    if (start == std::string_view::npos)
        return {};
    reply.remove_prefix(start + 3);

    auto const end = reply.find('c');
    if (end == std::string_view::npos)
        return {};
    reply = reply.substr(0, end);

    auto params = std::vector<int> {};
    while (!reply.empty())
    {
        auto const sep = reply.find(';');
        auto const field = reply.substr(0, sep);
        auto value = 0;
        auto const [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
        if (ec == std::errc {} && ptr == field.data() + field.size())
            params.push_back(value);
        if (sep == std::string_view::npos)
            break;
        reply.remove_prefix(sep + 1);
    }
    return params;
}

auto hasSixelAttribute(const std::vector<int>& params) noexcept -> bool
{
    for (auto i = std::size_t { 1 }; i < params.size(); ++i)
    {
        if (params[i] == 4)
            return true;
    }
    return false;
}

auto queryDeviceAttributes(std::chrono::milliseconds timeout) -> std::optional<std::string>
{
    if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO))
        return std::nullopt;

    auto const guard = RawModeGuard(STDIN_FILENO);
    if (!guard.active())
        return std::nullopt;

    if (auto const sent = writeAll(STDOUT_FILENO, PrimaryDeviceAttributes); !sent)
    {
        log::debug("DA1 query failed: {}", sent.error());
        return std::nullopt;
    }

    auto reply = std::string {};
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (!isCompleteReply(reply))
    {
        auto const left =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0)
        {
            log::debug("DA1 query timed out after {}ms", timeout.count());
            return std::nullopt;
        }

        auto pfd = pollfd { .fd = STDIN_FILENO, .events = POLLIN, .revents = 0 };
        if (::poll(&pfd, 1, static_cast<int>(left.count())) <= 0)
            continue;

        auto buf = std::array<char, 64> {};
        auto const n = ::read(STDIN_FILENO, buf.data(), buf.size());
        if (n <= 0)
            continue;
        reply.append(buf.data(), static_cast<size_t>(n));
    }

    return reply;
}

auto querySixelSupport(std::chrono::milliseconds timeout) -> bool
{
    auto const reply = queryDeviceAttributes(timeout);
    if (!reply)
        return false;

    auto const params = parseDeviceAttributes(*reply);
    log::debug("DA1 reply parameters: {}", params.size());
    return hasSixelAttribute(params);
}

} // namespace klipdot::tui
