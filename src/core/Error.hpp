// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace mindcast
{

/// @brief Error codes for categorizing failures across the application.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    NotFound,
    CorruptSnapshot,
    ModelLoadError,
    InferenceError,
    MalformedResponse,
    MalformedMarkup,
    SynthesisError,
    ProcessError,
    TimeoutError,
    DecodeError,
    MixError,
    NoCandidate,
};

/// @brief Converts an ErrorCode to a short human readable name.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid argument";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::ConfigError: return "config error";
        case ErrorCode::NotFound: return "not found";
        case ErrorCode::CorruptSnapshot: return "corrupt snapshot";
        case ErrorCode::ModelLoadError: return "model load error";
        case ErrorCode::InferenceError: return "inference error";
        case ErrorCode::MalformedResponse: return "malformed response";
        case ErrorCode::MalformedMarkup: return "malformed markup";
        case ErrorCode::SynthesisError: return "synthesis error";
        case ErrorCode::ProcessError: return "process error";
        case ErrorCode::TimeoutError: return "timeout";
        case ErrorCode::DecodeError: return "decode error";
        case ErrorCode::MixError: return "mix error";
        case ErrorCode::NoCandidate: return "no candidate";
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

} // namespace mindcast

template <>
struct std::formatter<mindcast::Error>: std::formatter<std::string>
{
    auto format(const mindcast::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", mindcast::errorCodeName(error.code), error.message), ctx);
    }
};
