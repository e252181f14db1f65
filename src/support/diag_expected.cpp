//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across the support
// library: the Expected<void> specialization, severity and error-code naming,
// and the printer used by command-line tools.
//
//===----------------------------------------------------------------------===//

#include "diag_expected.hpp"

namespace radiant::support
{
/// @brief Construct an Expected<void> that stores a diagnostic error state.
///
/// @param diag Diagnostic to transfer into the error payload.
Expected<void>::Expected(Diag diag) : error_(std::move(diag)) {}

/// @brief Report whether the Expected<void> represents a successful outcome.
///
/// @return True if the instance holds no diagnostic (success), otherwise false.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
///
/// @details Callers must ensure the `Expected` represents an error before
///          invoking this accessor.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

ErrorCode Expected<void>::code() const
{
    return error_->code;
}

namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
///
/// @param severity Severity enumeration value to translate.
/// @return Null-terminated string naming the severity level.
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

const char *errorCodeName(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::None:
            return "none";
        case ErrorCode::NotFound:
            return "not-found";
        case ErrorCode::DuplicateName:
            return "duplicate-name";
        case ErrorCode::InvalidLifecycleState:
            return "invalid-lifecycle-state";
        case ErrorCode::NotADirectory:
            return "not-a-directory";
        case ErrorCode::InvalidArgument:
            return "invalid-argument";
    }
    return "unknown";
}

/// @brief Build an error diagnostic with the provided category and message.
///
/// @param code Failure category reported to the caller.
/// @param msg Human-readable description of the problem.
/// @return Diagnostic populated with error severity.
Diag makeError(ErrorCode code, std::string msg)
{
    return Diag{Severity::Error, code, std::move(msg)};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details Emits "<severity>: <message>" followed by a newline so several
///          diagnostics appear as a contiguous block.  Error diagnostics carry
///          their category in brackets so scripts can match on it.
void printDiag(const Diag &diag, std::ostream &os)
{
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message;
    if (diag.code != ErrorCode::None)
        os << " [" << errorCodeName(diag.code) << "]";
    os << '\n';
}
} // namespace radiant::support
