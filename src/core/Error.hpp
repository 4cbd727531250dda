// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace storyloom
{

/// @brief Error codes for categorizing failures across the application.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    InvalidConfig,
    ModelLoadError,
    GenerationFailed,
    Cancelled,
};

/// @brief Returns a short name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::ModelLoadError: return "ModelLoadError";
        case ErrorCode::GenerationFailed: return "GenerationFailed";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;

    /// @brief The offending configuration key for InvalidConfig errors (e.g. "sampling.topP").
    std::string key;
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
    return std::unexpected<Error>(Error { code, std::move(message), {} });
}

/// @brief Creates an InvalidConfig error that names the offending key.
/// @param key The fully qualified configuration key.
/// @param message What is wrong with the value.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeConfigError(std::string_view key, std::string_view message)
    -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error {
        ErrorCode::InvalidConfig,
        std::format("Invalid config value '{}': {}", key, message),
        std::string(key),
    });
}

} // namespace storyloom

template <>
struct std::formatter<storyloom::Error>: std::formatter<std::string>
{
    auto format(const storyloom::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", storyloom::errorCodeName(error.code), error.message), ctx);
    }
};
