// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <string>
#include <string_view>

namespace klipdot
{

/// @brief Writes all of @p data to @p fd, retrying on EINTR and short writes.
[[nodiscard]] auto writeAll(int fd, std::string_view data) -> VoidResult;

/// @brief Reads @p fd until EOF.
[[nodiscard]] auto readAll(int fd) -> Result<std::string>;

/// @brief Returns a sink that writes every chunk to @p fd; write errors are logged.
[[nodiscard]] auto makeFdSink(int fd) -> OutputSink;

} // namespace klipdot
