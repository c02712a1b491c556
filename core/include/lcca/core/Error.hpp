/**
 * @file Error.hpp
 * @brief Structured error type with source location tracking.
 *
 * Defines the error codes raised by the estimation core and a lightweight
 * Error value carrying the code, a human-readable message, and the source
 * location where the error was raised.
 *
 * Only fatal conditions are errors: shape mismatches, unknown solver
 * modes, invalid arguments. Degenerate inputs and numerical instabilities
 * are recovered from, logged, and counted in the result diagnostics.
 *
 * @author MasterLaplace
 */
#pragma once

#ifndef LCCA_CORE_ERROR_HPP
    #define LCCA_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>

namespace lcca::core {

/**
 * @brief Exhaustive catalog of fatal error conditions.
 */
enum class ErrorCode : u8 {
    kInvalidArgument,
    kShapeMismatch,
    kUnknownSolverMode,
    kDecompositionFailed,
    kEmptyInput,
    kNonFiniteInput
};

/**
 * @brief Returns a short human-readable label for the given error code.
 */
[[nodiscard]] constexpr std::string_view errorCodeName(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::kInvalidArgument:     return "InvalidArgument";
        case ErrorCode::kShapeMismatch:       return "ShapeMismatch";
        case ErrorCode::kUnknownSolverMode:   return "UnknownSolverMode";
        case ErrorCode::kDecompositionFailed: return "DecompositionFailed";
        case ErrorCode::kEmptyInput:          return "EmptyInput";
        case ErrorCode::kNonFiniteInput:      return "NonFiniteInput";
    }
    return "Unknown";
}

/**
 * @brief Structured error value carrying a code, message, and origin.
 */
class Error final {
public:
    /**
     * @brief Construct an error from a code and message.
     * @param code    Enumerated error code.
     * @param message Human-readable description.
     * @param loc     Source location (auto-filled by the compiler).
     */
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    [[nodiscard]] ErrorCode            code()     const { return _code; }
    [[nodiscard]] const std::string &  message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

    /**
     * @brief Formats the error as "[Code] message (file:line)".
     */
    [[nodiscard]] std::string format() const;

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
};

/// @brief Convenience alias for std::unexpected<Error>.
using Unexpected = std::unexpected<Error>;

/// @brief Factory function to create an unexpected error.
/// @param code Error code.
/// @param message Human-readable description.
/// @param loc Source location (auto-filled).
/// @return std::unexpected<Error>.
[[nodiscard]] inline auto makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

} // namespace lcca::core

#endif // LCCA_CORE_ERROR_HPP
