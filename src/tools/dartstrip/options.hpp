//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/dartstrip/options.hpp
// Purpose: Configuration for one dartstrip run.
// Key invariants: extension starts with '.'; jobs == 0 selects the hardware
//                 concurrency.
// Ownership/Lifetime: Plain value type.
// Links: src/tools/dartstrip/cli.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dartstrip/strip/Process.hpp"

#include <string>
#include <vector>

namespace dartstrip::tools
{

/// @brief Exclusion globs applied unless --no-default-excludes is given.
inline const std::vector<std::string> &defaultExcludes()
{
    static const std::vector<std::string> kExcludes = {
        "**/build/**", "**/ios/**", "**/android/**", "**/web/**", "**/test/**"};
    return kExcludes;
}

/// @brief Settings collected from the command line.
struct ToolOptions
{
    /// @brief Project directory to rewrite in place.
    std::string root{};

    /// @brief Extension selecting the files to process.
    std::string extension{".dart"};

    /// @brief Extra exclusion globs from --exclude.
    std::vector<std::string> excludes{};

    /// @brief Whether defaultExcludes() applies in addition to excludes.
    bool useDefaultExcludes = true;

    /// @brief Worker thread count; 0 means one per hardware thread.
    unsigned jobs = 0;

    /// @brief Suppress per-file progress lines.
    bool quiet = false;

    /// @brief Scanner policy handed to strip::process().
    strip::ScanOptions scan{};

    /// @brief Combined exclusion list in effect for this run.
    std::vector<std::string> effectiveExcludes() const
    {
        std::vector<std::string> all;
        if (useDefaultExcludes)
            all = defaultExcludes();
        all.insert(all.end(), excludes.begin(), excludes.end());
        return all;
    }
};

} // namespace dartstrip::tools
