//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Provides diagnostic helpers and a lightweight Expected container used
//          by every fallible file system and kernel operation.
// Key invariants: An Expected holds either a value or exactly one diagnostic.
// Ownership/Lifetime: Expected owns its value or diagnostic.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace radiant::support
{
using Diag = Diagnostic;

/// @brief Expected-style container pairing a value with a diagnostic on error.
/// @tparam T Stored value type when the operation succeeds.
/// @note Mirrors a subset of std::expected.
template <class T> class Expected
{
  public:
    /// @brief Construct a successful result containing @p value.
    /// @param value Value produced by a successful computation.
    /// @details Enabled only when the provided value does not decay to Diag or
    ///          to Expected itself, so the diagnostic constructor below and the
    ///          implicit copy/move constructors keep working.
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding diagnostic @p diag.
    /// @param diag Diagnostic to return to the caller.
    Expected(Diag diag) : error_(std::move(diag)) {}

    /// @brief Check whether a value is present.
    /// @return True when the Expected stores a value.
    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the stored value; requires hasValue().
    T &value()
    {
        return *value_;
    }

    /// @brief Access the stored value; requires hasValue().
    const T &value() const
    {
        return *value_;
    }

    /// @brief Access the diagnostic describing the failure.
    const Diag &error() const &
    {
        return *error_;
    }

    /// @brief Shorthand for error().code; requires !hasValue().
    [[nodiscard]] ErrorCode code() const
    {
        return error_->code;
    }

  private:
    std::optional<T> value_;
    std::optional<Diag> error_;
};

/// @brief Expected specialization for void success type.
template <> class Expected<void>
{
  public:
    /// @brief Construct a successful result with no payload.
    Expected() = default;

    /// @brief Construct an error result holding diagnostic @p diag.
    /// @param diag Diagnostic describing the failure.
    Expected(Diag diag);

    /// @brief Check whether the Expected represents success.
    [[nodiscard]] bool hasValue() const;

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const;

    /// @brief Access the diagnostic describing the failure.
    const Diag &error() const &;

    /// @brief Shorthand for error().code; requires !hasValue().
    [[nodiscard]] ErrorCode code() const;

  private:
    std::optional<Diag> error_;
};

namespace detail
{
/// @brief Convert diagnostic severity to lowercase string.
const char *diagSeverityToString(Severity severity);
} // namespace detail

/// @brief Stable lowercase name of @p code for messages and tests.
const char *errorCodeName(ErrorCode code);

/// @brief Create an error diagnostic with failure category and message.
/// @param code Failure category.
/// @param msg Human-readable diagnostic message.
/// @return Diagnostic marked as an error severity.
Diag makeError(ErrorCode code, std::string msg);

/// @brief Print a single diagnostic to the provided stream.
/// @param diag Diagnostic to format.
/// @param os Output stream receiving the text.
void printDiag(const Diag &diag, std::ostream &os);
} // namespace radiant::support
