//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/dartstrip/file_collector.hpp
// Purpose: Recursive discovery of the files a run should process.
// Key invariants: Results are sorted by relative path; relative paths use '/'
//                 separators on every platform.
// Ownership/Lifetime: Returned vector owned by the caller.
// Links: support/glob.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace dartstrip::tools
{

/// @brief One discovered file.
struct CollectedFile
{
    std::filesystem::path path; ///< Root joined with the relative path.
    std::string relative;       ///< Path relative to the root, generic form.
};

/// @brief Find regular files below @p root whose extension is @p ext.
///
/// A directory whose relative path plus a trailing '/' matches one of
/// @p excludes is not descended into; a file whose relative path matches one
/// is skipped.
///
/// @return Sorted list of files, or an error diagnostic when the directory
///         tree cannot be walked.
dartstrip::support::Expected<std::vector<CollectedFile>> collectFiles(
    const std::filesystem::path &root,
    const std::string &ext,
    const std::vector<std::string> &excludes);

} // namespace dartstrip::tools
