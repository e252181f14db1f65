//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements DiagnosticEngine.  radiant-shell feeds every failed command line
// into one engine per run; a failure never stops the command loop, and the
// error count decides whether the driver exits with status 0 or 1.
//
//===----------------------------------------------------------------------===//

#include "diagnostics.hpp"
#include "diag_expected.hpp"

namespace radiant::support
{

// Notes carry no count; only errors and warnings are tallied.
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/// @brief Replay every recorded failure through printDiag, in the order the
///        commands ran.
void DiagnosticEngine::printAll(std::ostream &os) const
{
    for (const auto &d : diags_)
        printDiag(d, os);
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}

} // namespace radiant::support
