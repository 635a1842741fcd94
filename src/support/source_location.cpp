//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line validity query for SourceLoc.  A location is valid once it names
// a file registered with a SourceManager; line and column stay optional so a
// diagnostic can point at a whole file (I/O failures) or at a position inside
// it (scanner warnings).
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace dartstrip::support
{

/// @brief Determine whether the location carries a file attachment.
/// @return True when file_id was handed out by a SourceManager.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}

} // namespace dartstrip::support
