// SPDX-License-Identifier: Apache-2.0
#include "ChildProcess.hpp"

#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace klipdot
{

namespace
{
    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    auto toExitStatus(int status) -> ExitStatus
    {
        if (WIFSIGNALED(status))
            return ExitStatus { .code = 0, .signal = WTERMSIG(status) };
        return ExitStatus { .code = WEXITSTATUS(status), .signal = 0 };
    }

    /// Pipe pair for one standard stream; childEnd goes to the child, parentEnd stays.
    struct StreamPipe
    {
        int childEnd = -1;
        int parentEnd = -1;

        void closeBoth()
        {
            closeFd(childEnd);
            closeFd(parentEnd);
        }
    };

    auto openPipe(StreamMode mode, bool childReads, StreamPipe& out) -> VoidResult
    {
        if (mode != StreamMode::Pipe)
            return {};

        auto fds = std::array<int, 2> { -1, -1 };
        if (::pipe(fds.data()) != 0)
            return makeError(ErrorCode::ProcessError, std::format("Failed to create pipe: {}", std::strerror(errno)));

        out.childEnd = childReads ? fds[0] : fds[1];
        out.parentEnd = childReads ? fds[1] : fds[0];
        ::fcntl(out.parentEnd, F_SETFD, FD_CLOEXEC);
        return {};
    }

    void addStreamAction(posix_spawn_file_actions_t& actions, StreamMode mode, StreamPipe const& pipe, int target)
    {
        switch (mode)
        {
            case StreamMode::Inherit: break;
            case StreamMode::Pipe:
                posix_spawn_file_actions_adddup2(&actions, pipe.childEnd, target);
                posix_spawn_file_actions_addclose(&actions, pipe.childEnd);
                break;
            case StreamMode::Null:
                posix_spawn_file_actions_addopen(
                    &actions, target, "/dev/null", target == STDIN_FILENO ? O_RDONLY : O_WRONLY, 0);
                break;
        }
    }
} // namespace

struct ChildProcess::Impl
{
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;
    std::string command;
    std::optional<ExitStatus> exitStatus;
};

ChildProcess::ChildProcess(): _impl(std::make_unique<Impl>())
{
}

ChildProcess::~ChildProcess()
{
    closeFd(_impl->stdinWrite);
    closeFd(_impl->stdoutRead);
    closeFd(_impl->stderrRead);
    if (_impl->childPid > 0 && !_impl->exitStatus)
        terminate();
}

auto ChildProcess::start(const ChildProcessConfig& config) -> VoidResult
{
    if (_impl->childPid > 0)
        return makeError(ErrorCode::ProcessError, "Process already started");
    if (config.command.empty())
        return makeError(ErrorCode::InvalidArgument, "Empty command");

    auto stdinPipe = StreamPipe {};
    auto stdoutPipe = StreamPipe {};
    auto stderrPipe = StreamPipe {};

    auto cleanupPipes = [&]() {
        stdinPipe.closeBoth();
        stdoutPipe.closeBoth();
        stderrPipe.closeBoth();
    };

    for (auto const& opened: { openPipe(config.stdinMode, true, stdinPipe),
                               openPipe(config.stdoutMode, false, stdoutPipe),
                               openPipe(config.stderrMode, false, stderrPipe) })
    {
        if (!opened)
        {
            cleanupPipes();
            return std::unexpected(opened.error());
        }
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    addStreamAction(actions, config.stdinMode, stdinPipe, STDIN_FILENO);
    addStreamAction(actions, config.stdoutMode, stdoutPipe, STDOUT_FILENO);
    addStreamAction(actions, config.stderrMode, stderrPipe, STDERR_FILENO);

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment (inherit + config overrides)
    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const entry = std::string_view { *e };
            auto const key = entry.substr(0, entry.find('='));
            if (!config.env.contains(std::string { key }))
                envStrings.emplace_back(entry);
        }
    }
    for (const auto& [key, value]: config.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    // The child starts with default SIGPIPE handling and an empty signal mask,
    // whatever this process ignores or blocks.
    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    auto defaultSignals = sigset_t {};
    sigemptyset(&defaultSignals);
    sigaddset(&defaultSignals, SIGPIPE);
    auto emptyMask = sigset_t {};
    sigemptyset(&emptyMask);
    posix_spawnattr_setsigdefault(&attributes, &defaultSignals);
    posix_spawnattr_setsigmask(&attributes, &emptyMask);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);

    pid_t pid;
    auto const status = posix_spawnp(&pid, config.command.c_str(), &actions, &attributes, argv.data(), envp.data());
    posix_spawnattr_destroy(&attributes);
    posix_spawn_file_actions_destroy(&actions);

    closeFd(stdinPipe.childEnd);
    closeFd(stdoutPipe.childEnd);
    closeFd(stderrPipe.childEnd);

    if (status != 0)
    {
        cleanupPipes();
        return makeError(ErrorCode::ProcessError,
                         std::format("Failed to spawn process '{}': {}", config.command, std::strerror(status)));
    }

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe.parentEnd;
    _impl->stdoutRead = stdoutPipe.parentEnd;
    _impl->stderrRead = stderrPipe.parentEnd;
    _impl->command = config.command;
    _impl->exitStatus.reset();

    log::debug("Spawned '{}' (pid {})", config.command, pid);
    return {};
}

auto ChildProcess::stdinFd() const noexcept -> int
{
    return _impl->stdinWrite;
}

auto ChildProcess::stdoutFd() const noexcept -> int
{
    return _impl->stdoutRead;
}

auto ChildProcess::stderrFd() const noexcept -> int
{
    return _impl->stderrRead;
}

void ChildProcess::closeStdin()
{
    closeFd(_impl->stdinWrite);
}

auto ChildProcess::pid() const noexcept -> int
{
    return _impl->childPid;
}

auto ChildProcess::command() const -> const std::string&
{
    return _impl->command;
}

auto ChildProcess::wait() -> Result<ExitStatus>
{
    if (_impl->exitStatus)
        return *_impl->exitStatus;
    if (_impl->childPid <= 0)
        return makeError(ErrorCode::ProcessError, "Process not started");

    int status = 0;
    while (::waitpid(_impl->childPid, &status, 0) < 0)
    {
        if (errno != EINTR)
            return makeError(ErrorCode::ProcessError, std::format("waitpid failed: {}", std::strerror(errno)));
    }

    _impl->exitStatus = toExitStatus(status);
    return *_impl->exitStatus;
}

auto ChildProcess::waitFor(std::chrono::milliseconds timeout) -> Result<std::optional<ExitStatus>>
{
    if (_impl->exitStatus)
        return _impl->exitStatus;
    if (_impl->childPid <= 0)
        return makeError(ErrorCode::ProcessError, "Process not started");

    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        int status = 0;
        auto const rc = ::waitpid(_impl->childPid, &status, WNOHANG);
        if (rc == _impl->childPid)
        {
            _impl->exitStatus = toExitStatus(status);
            return _impl->exitStatus;
        }
        if (rc < 0 && errno != EINTR)
            return makeError(ErrorCode::ProcessError, std::format("waitpid failed: {}", std::strerror(errno)));
        if (std::chrono::steady_clock::now() >= deadline)
            return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

void ChildProcess::terminate()
{
    if (_impl->childPid <= 0 || _impl->exitStatus)
        return;

    ::kill(_impl->childPid, SIGTERM);
    auto const exited = waitFor(std::chrono::milliseconds(500));
    if (exited && *exited)
        return;

    log::warning("Process '{}' ignored SIGTERM, killing", _impl->command);
    ::kill(_impl->childPid, SIGKILL);
    if (auto const killed = wait(); !killed)
        log::error("Failed to reap '{}': {}", _impl->command, killed.error());
}

} // namespace klipdot
