// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace klipdot
{

/// @brief How a standard stream of a spawned child is wired.
enum class StreamMode
{
    Inherit, ///< Share the parent's descriptor.
    Pipe,    ///< Connect to a pipe readable/writable by the parent.
    Null,    ///< Redirect to /dev/null.
};

/// @brief Configuration for spawning a child process.
struct ChildProcessConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    StreamMode stdinMode = StreamMode::Inherit;
    StreamMode stdoutMode = StreamMode::Pipe;
    StreamMode stderrMode = StreamMode::Pipe;
};

/// @brief Termination status of a child process.
struct ExitStatus
{
    int code = 0;   ///< Exit code, valid when signal is 0.
    int signal = 0; ///< Terminating signal number, or 0 for a normal exit.

    [[nodiscard]] auto success() const noexcept -> bool { return signal == 0 && code == 0; }

    /// @brief Shell-style exit code (128 + signal for signalled children).
    [[nodiscard]] auto shellCode() const noexcept -> int { return signal != 0 ? 128 + signal : code; }
};

/// @brief A spawned child process with optional piped standard streams.
///
/// The object owns the parent ends of any pipes and reaps the child on
/// destruction if nobody waited for it.
class ChildProcess
{
  public:
    ChildProcess();
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /// @brief Spawns the process described by @p config.
    [[nodiscard]] auto start(const ChildProcessConfig& config) -> VoidResult;

    /// @brief Parent end of the child's stdin pipe, or -1.
    [[nodiscard]] auto stdinFd() const noexcept -> int;
    /// @brief Parent end of the child's stdout pipe, or -1.
    [[nodiscard]] auto stdoutFd() const noexcept -> int;
    /// @brief Parent end of the child's stderr pipe, or -1.
    [[nodiscard]] auto stderrFd() const noexcept -> int;

    /// @brief Closes the parent end of the stdin pipe, signalling EOF to the child.
    void closeStdin();

    [[nodiscard]] auto pid() const noexcept -> int;
    [[nodiscard]] auto command() const -> const std::string&;

    /// @brief Blocks until the child exits.
    [[nodiscard]] auto wait() -> Result<ExitStatus>;

    /// @brief Waits up to @p timeout for the child to exit.
    /// @return The status, or std::nullopt if the child is still running.
    [[nodiscard]] auto waitFor(std::chrono::milliseconds timeout) -> Result<std::optional<ExitStatus>>;

    /// @brief Sends SIGTERM, waits briefly, then SIGKILL, and reaps the child.
    void terminate();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace klipdot
