//===----------------------------------------------------------------------===//
//
// Part of the Pathnorm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used by the
// configuration layer and the command-line tool.  The utilities defined here
// wrap structured diagnostics around an Expected<void> type, provide
// consistent severity-to-string mapping, and print diagnostics with their
// origin prefix.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies the `Expected<void>` helpers specialized for diagnostics.

#include "diag_expected.hpp"

namespace pathnorm::support
{
/// @brief Construct an Expected<void> that stores a diagnostic error state.
/// @param diag Diagnostic to transfer into the error payload.
Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

/// @brief Report whether the Expected<void> represents a successful outcome.
/// @return True if the instance holds no diagnostic (success), otherwise false.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

/// @brief Allow Expected<void> to participate directly in boolean tests.
Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
///
/// @details Callers must ensure the `Expected` represents an error before
///          invoking this accessor; doing so is undefined behaviour otherwise.
///
/// @return Reference to the stored diagnostic payload.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
///
/// @details New severity enumerators should extend this switch to maintain
///          predictable wording across command-line tools.
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

Diag makeError(std::string origin, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), std::move(origin)};
}

Diag makeWarning(std::string origin, std::string msg)
{
    return Diag{Severity::Warning, std::move(msg), std::move(origin)};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When an origin is recorded the message is prefixed with
///          "<origin>: " following the common compiler diagnostic style.  The
///          function always emits a trailing newline so multiple diagnostics
///          appear as a contiguous block.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
void printDiag(const Diag &diag, std::ostream &os)
{
    if (!diag.origin.empty())
        os << diag.origin << ": ";
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}
} // namespace pathnorm::support
