//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine used by the dartstrip tool.
 * @details
 *     The engine keeps every diagnostic of a run so the driver can print them
 *     in one block and derive the process exit status from the error count.
 */

#include "support/diagnostics.hpp"

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

namespace dartstrip::support
{

/**
 * @brief Store @p d and bump the counter matching its severity.
 *
 * Notes are stored but not counted.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/**
 * @brief Print every stored diagnostic through printDiag().
 *
 * @param os Stream receiving one line per diagnostic.
 * @param sm Source manager resolving file ids into paths, if any.
 */
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
        printDiag(d, os, sm);
}

/// @brief Number of error-severity diagnostics reported so far.
size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

/// @brief Number of warning-severity diagnostics reported so far.
size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}

} // namespace dartstrip::support
