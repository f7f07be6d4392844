// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace klipdot
{

/// @brief Error codes for categorizing failures across the pipeline.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    DecodeError,
    UnrecognizedFormat,
    RenderError,
    UnsupportedMethod,
    ProcessError,
    ClipboardError,
    TimeoutError,
};

/// @brief Returns a short upper-case tag for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::IoError: return "IO";
        case ErrorCode::ConfigError: return "CONFIG";
        case ErrorCode::DecodeError: return "DECODE";
        case ErrorCode::UnrecognizedFormat: return "UNRECOGNIZED_FORMAT";
        case ErrorCode::RenderError: return "RENDER";
        case ErrorCode::UnsupportedMethod: return "UNSUPPORTED_METHOD";
        case ErrorCode::ProcessError: return "PROCESS";
        case ErrorCode::ClipboardError: return "CLIPBOARD";
        case ErrorCode::TimeoutError: return "TIMEOUT";
    }
    return "UNKNOWN";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace klipdot

template <>
struct std::formatter<klipdot::Error>: std::formatter<std::string>
{
    auto format(const klipdot::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", klipdot::errorCodeName(error.code), error.message), ctx);
    }
};
