//===----------------------------------------------------------------------===//
//
// Part of the Qshade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic engine responsible for collecting messages emitted
// by the transform pipeline and the developer tools.  Diagnostics are stored
// until callers explicitly print or inspect them.
//
//===----------------------------------------------------------------------===//

#include "support/diagnostics.hpp"
#include "support/diag_expected.hpp"

namespace il::support
{

/// @brief Add a diagnostic to the engine and update severity counters.
/// @param d Diagnostic to record; moved into the engine's storage.
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/// @brief Write all stored diagnostics to @p os through printDiag.
void DiagnosticEngine::printAll(std::ostream &os) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os);
    }
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}
} // namespace il::support
