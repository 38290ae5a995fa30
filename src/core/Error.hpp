// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace mcpvisor
{

/// @brief Error codes for categorizing failures across the engine.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    ConfigValidationError,
    ConnectionError,
    ProtocolError,
    RequestTimeoutError,
    ToolExecutionError,
    ServerNotFoundError,
    ServerNotRunningError,
    InvalidState,
};

/// @brief Returns a stable, human-readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::ConfigValidationError: return "ConfigValidationError";
        case ErrorCode::ConnectionError: return "ConnectionError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::RequestTimeoutError: return "RequestTimeoutError";
        case ErrorCode::ToolExecutionError: return "ToolExecutionError";
        case ErrorCode::ServerNotFoundError: return "ServerNotFoundError";
        case ErrorCode::ServerNotRunningError: return "ServerNotRunningError";
        case ErrorCode::InvalidState: return "InvalidState";
    }
    return "Unknown";
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

/// @brief Re-wraps an existing error, prefixing its message with context.
/// @param error The original error; its code is kept.
/// @param context Text placed in front of the original message.
[[nodiscard]] inline auto withContext(const Error& error, std::string_view context) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { error.code, std::format("{}: {}", context, error.message) });
}

} // namespace mcpvisor

template <>
struct std::formatter<mcpvisor::Error>: std::formatter<std::string>
{
    auto format(const mcpvisor::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", mcpvisor::errorCodeName(error.code), error.message), ctx);
    }
};
