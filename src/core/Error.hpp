// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace mcpman
{

/// @brief Error codes for categorizing failures across the application.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    NotFound,
    Unsupported,
    ProcessError,
    ParseError,
    ConfigError,
    ConfigIoError,
    ConfigParseError,
    ValidationError,
};

/// @brief Returns a short human readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid-argument";
        case ErrorCode::IoError: return "io";
        case ErrorCode::NotFound: return "not-found";
        case ErrorCode::Unsupported: return "unsupported";
        case ErrorCode::ProcessError: return "process";
        case ErrorCode::ParseError: return "parse";
        case ErrorCode::ConfigError: return "config";
        case ErrorCode::ConfigIoError: return "config-io";
        case ErrorCode::ConfigParseError: return "config-parse";
        case ErrorCode::ValidationError: return "validation";
    }
    return "unknown";
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

} // namespace mcpman

template <>
struct std::formatter<mcpman::Error>: std::formatter<std::string>
{
    auto format(const mcpman::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", mcpman::errorCodeName(error.code), error.message), ctx);
    }
};
