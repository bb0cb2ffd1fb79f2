//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented helpers that accompany Expected: severity
// spelling, error construction and the single-diagnostic printer every tool
// and test uses to render failures in a uniform format.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

namespace il::support
{
namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
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

/// @brief Build an error diagnostic with the provided location and message.
Diag makeError(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When a line is known the message is prefixed with
///          "<line>:<column>:" following the common compiler diagnostic style.
///          A stable diagnostic code, when present, follows the severity in
///          square brackets.  The function always emits a trailing newline so
///          multiple diagnostics appear as a contiguous block.
void printDiag(const Diag &diag, std::ostream &os)
{
    if (diag.loc.isValid())
    {
        os << diag.loc.line;
        if (diag.loc.hasColumn())
            os << ':' << diag.loc.column;
        os << ": ";
    }
    os << detail::diagSeverityToString(diag.severity);
    if (!diag.code.empty())
        os << '[' << diag.code << ']';
    os << ": " << diag.message << '\n';
}
} // namespace il::support
