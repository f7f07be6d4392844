// SPDX-License-Identifier: Apache-2.0
#include "FdIo.hpp"

#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>

#include <unistd.h>

namespace klipdot
{

auto writeAll(int fd, std::string_view data) -> VoidResult
{
    while (!data.empty())
    {
        auto const n = ::write(fd, data.data(), data.size());
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::IoError, std::format("write to fd {} failed: {}", fd, std::strerror(errno)));
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return {};
}

auto readAll(int fd) -> Result<std::string>
{
    auto out = std::string {};
    auto buf = std::array<char, 8192> {};
    while (true)
    {
        auto const n = ::read(fd, buf.data(), buf.size());
        if (n == 0)
            return out;
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::IoError, std::format("read from fd {} failed: {}", fd, std::strerror(errno)));
        }
        out.append(buf.data(), static_cast<size_t>(n));
    }
}

auto makeFdSink(int fd) -> OutputSink
{
    return [fd](std::string_view data) {
        if (auto const written = writeAll(fd, data); !written)
            log::debug("{}", written.error());
    };
}

} // namespace klipdot
