// SPDX-License-Identifier: Apache-2.0
#include "Subprocess.hpp"

#include <core/ChildProcess.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <format>

#include <poll.h>
#include <unistd.h>

namespace klipdot
{

namespace
{
    /// Drains one readable descriptor into @p sink. Returns false at EOF or on error.
    auto drainInto(int fd, std::string& sink) -> bool
    {
        auto buf = std::array<char, 4096> {};
        auto const n = ::read(fd, buf.data(), buf.size());
        if (n > 0)
        {
            sink.append(buf.data(), static_cast<size_t>(n));
            return true;
        }
        if (n < 0 && (errno == EINTR || errno == EAGAIN))
            return true;
        return false;
    }
} // namespace

auto runCommand(const CommandSpec& spec, std::optional<std::chrono::milliseconds> timeout) -> Result<CommandOutput>
{
    auto process = ChildProcess {};
    auto started = process.start(ChildProcessConfig {
        .command = spec.program,
        .args = spec.args,
        .env = {},
        .stdinMode = spec.stdinData ? StreamMode::Pipe : StreamMode::Null,
        .stdoutMode = spec.discardOutput ? StreamMode::Null : StreamMode::Pipe,
        .stderrMode = spec.discardOutput ? StreamMode::Null : StreamMode::Pipe,
    });
    if (!started)
        return std::unexpected(started.error());

    if (spec.stdinData)
    {
        // A helper that exits early closes its end. SIGPIPE is ignored process-wide
        // (App::initialize), so the write fails with EPIPE and input is abandoned.
        auto remaining = std::string_view { *spec.stdinData };
        while (!remaining.empty())
        {
            auto const n = ::write(process.stdinFd(), remaining.data(), remaining.size());
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                break;
            }
            remaining.remove_prefix(static_cast<size_t>(n));
        }
        process.closeStdin();
    }

    auto output = CommandOutput {};
    auto stdoutOpen = process.stdoutFd() >= 0;
    auto stderrOpen = process.stderrFd() >= 0;
    auto const deadline = timeout ? std::optional { std::chrono::steady_clock::now() + *timeout } : std::nullopt;

    while (stdoutOpen || stderrOpen)
    {
        auto fds = std::array<pollfd, 2> {
            pollfd { .fd = stdoutOpen ? process.stdoutFd() : -1, .events = POLLIN, .revents = 0 },
            pollfd { .fd = stderrOpen ? process.stderrFd() : -1, .events = POLLIN, .revents = 0 },
        };

        auto waitMs = -1;
        if (deadline)
        {
            auto const left = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0)
            {
                process.terminate();
                return makeError(ErrorCode::TimeoutError,
                                 std::format("Command timed out: {}", describeCommand(spec)));
            }
            waitMs = static_cast<int>(left.count());
        }

        auto const rc = ::poll(fds.data(), fds.size(), waitMs);
        if (rc < 0)
        {
            if (errno == EINTR)
                continue;
            process.terminate();
            return makeError(ErrorCode::ProcessError, std::format("poll failed: {}", std::strerror(errno)));
        }

        if (stdoutOpen && (fds[0].revents & (POLLIN | POLLHUP | POLLERR)))
            stdoutOpen = drainInto(process.stdoutFd(), output.stdoutData);
        if (stderrOpen && (fds[1].revents & (POLLIN | POLLHUP | POLLERR)))
            stderrOpen = drainInto(process.stderrFd(), output.stderrData);
    }

    if (deadline)
    {
        auto const left = std::chrono::duration_cast<std::chrono::milliseconds>(
            *deadline - std::chrono::steady_clock::now());
        auto exited = process.waitFor(std::max(left, std::chrono::milliseconds(0)));
        if (!exited)
            return std::unexpected(exited.error());
        if (!*exited)
        {
            process.terminate();
            return makeError(ErrorCode::TimeoutError, std::format("Command timed out: {}", describeCommand(spec)));
        }
        output.exitCode = (*exited)->shellCode();
        return output;
    }

    auto status = process.wait();
    if (!status)
        return std::unexpected(status.error());

    output.exitCode = status->shellCode();
    return output;
}

auto systemCommandRunner(std::optional<std::chrono::milliseconds> timeout) -> CommandRunner
{
    return [timeout](const CommandSpec& spec) {
        return runCommand(spec, timeout);
    };
}

auto isCommandAvailable(std::string_view name) -> bool
{
    if (name.empty())
        return false;

    if (name.find('/') != std::string_view::npos)
        return ::access(std::string { name }.c_str(), X_OK) == 0;

    auto const* pathEnv = std::getenv("PATH");
    if (!pathEnv)
        return false;

    auto paths = std::string_view { pathEnv };
    while (!paths.empty())
    {
        auto const sep = paths.find(':');
        auto const dir = paths.substr(0, sep);
        paths = sep == std::string_view::npos ? std::string_view {} : paths.substr(sep + 1);
        if (dir.empty())
            continue;

        auto const candidate = std::filesystem::path { dir } / name;
        auto ec = std::error_code {};
        if (std::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0)
            return true;
    }
    return false;
}

auto describeCommand(const CommandSpec& spec) -> std::string
{
    auto line = spec.program;
    for (auto const& arg: spec.args)
    {
        line += ' ';
        line += arg;
    }
    return line;
}

} // namespace klipdot
