//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the Expected<void> members, the diagnostic factories and the
// printer shared by DiagnosticEngine::printAll and the CLI front end.  Every
// message the tool writes to its error stream goes through printDiag so the
// format stays uniform.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

namespace dartstrip::support
{

Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

/// @brief Success is the absence of a stored diagnostic.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the stored diagnostic; requires !hasValue().
const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
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

Diag makeError(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc};
}

Diag makeWarning(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Warning, std::move(msg), loc};
}

/// @brief Print @p diag followed by a newline.
///
/// @details The location prefix is emitted only when @p sm resolves the file
///          id; line and column follow the path when known.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    if (sm && diag.loc.isValid())
    {
        auto path = sm->getPath(diag.loc.file_id);
        if (!path.empty())
        {
            os << path;
            if (diag.loc.hasLine())
            {
                os << ':' << diag.loc.line;
                if (diag.loc.hasColumn())
                    os << ':' << diag.loc.column;
            }
            os << ": ";
        }
    }
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}

} // namespace dartstrip::support
