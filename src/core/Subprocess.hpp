// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace klipdot
{

/// @brief A helper command invocation with its captured input.
struct CommandSpec
{
    std::string program;
    std::vector<std::string> args;
    std::optional<std::string> stdinData; ///< Written to the child's stdin, which is then closed.
    bool discardOutput = false;           ///< Send stdout/stderr to /dev/null instead of capturing.
};

/// @brief Captured result of a finished command.
struct CommandOutput
{
    int exitCode = 0;
    std::string stdoutData;
    std::string stderrData;
};

/// @brief Callable that runs a command to completion.
///
/// Components that shell out to helpers take one of these so tests can
/// substitute a fake.
using CommandRunner = std::function<Result<CommandOutput>(const CommandSpec& spec)>;

/// @brief Runs @p spec to completion, capturing stdout and stderr.
/// @param timeout Kills the command and fails with TimeoutError when exceeded.
[[nodiscard]] auto runCommand(const CommandSpec& spec,
                              std::optional<std::chrono::milliseconds> timeout = std::nullopt)
    -> Result<CommandOutput>;

/// @brief Returns a CommandRunner bound to runCommand with the given timeout.
[[nodiscard]] auto systemCommandRunner(std::optional<std::chrono::milliseconds> timeout = std::nullopt)
    -> CommandRunner;

/// @brief Returns true if an executable named @p name is found on PATH.
[[nodiscard]] auto isCommandAvailable(std::string_view name) -> bool;

/// @brief Renders a command line for log messages.
[[nodiscard]] auto describeCommand(const CommandSpec& spec) -> std::string;

} // namespace klipdot
