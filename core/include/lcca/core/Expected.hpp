/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Expected<T> is std::expected<T, Error>. Three macros keep the
 * validation-heavy entry points of the estimator flat:
 *
 *  - LCCA_TRY(expr)            unwraps a value or returns its error,
 *  - LCCA_TRY_VOID(expr)       same for ExpectedVoid,
 *  - LCCA_ENSURE(cond, code, msg) returns a new error when @p cond fails.
 *
 * LCCA_TRY relies on GNU statement expressions (GCC, Clang).
 *
 * @author MasterLaplace
 */
#pragma once

#ifndef LCCA_CORE_EXPECTED_HPP
    #define LCCA_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>
    #include <utility>

namespace lcca::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace lcca::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type lcca::core::Expected<U>.
 */
#define LCCA_TRY(expr)                                                    \
    ({                                                                     \
        auto &&_lcca_result = (expr);                                      \
        if (!_lcca_result.has_value()) [[unlikely]]                        \
            return std::unexpected(std::move(_lcca_result.error()));        \
        std::move(_lcca_result.value());                                   \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type lcca::core::ExpectedVoid.
 */
#define LCCA_TRY_VOID(expr)                                               \
    do {                                                                    \
        auto &&_lcca_result = (expr);                                      \
        if (!_lcca_result.has_value()) [[unlikely]]                        \
            return std::unexpected(std::move(_lcca_result.error()));        \
    } while (false)

/**
 * @brief Return an error from the enclosing function unless @p cond holds.
 * @param cond Precondition.
 * @param code lcca::core::ErrorCode raised on failure.
 * @param msg  Message (anything convertible to std::string).
 */
#define LCCA_ENSURE(cond, code, msg)                                      \
    do {                                                                    \
        if (!(cond)) [[unlikely]]                                          \
            return ::lcca::core::makeError((code), (msg));                  \
    } while (false)

#endif // LCCA_CORE_EXPECTED_HPP
