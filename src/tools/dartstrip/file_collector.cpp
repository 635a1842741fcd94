//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/dartstrip/file_collector.cpp
// Purpose: Walk a project tree and select the files to strip.
// Key invariants: Excluded directories are pruned, never entered.
// Ownership/Lifetime: Stateless.
// Links: src/tools/dartstrip/file_collector.hpp
//
//===----------------------------------------------------------------------===//

#include "tools/dartstrip/file_collector.hpp"

#include "support/glob.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace dartstrip::tools
{
namespace
{
bool isExcluded(const std::string &relative, const std::vector<std::string> &excludes)
{
    return std::any_of(excludes.begin(), excludes.end(), [&](const std::string &pattern) {
        return support::globMatch(relative, pattern);
    });
}
} // namespace

dartstrip::support::Expected<std::vector<CollectedFile>> collectFiles(
    const fs::path &root, const std::string &ext, const std::vector<std::string> &excludes)
{
    using dartstrip::support::makeError;

    std::vector<CollectedFile> result;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;

    for (; !ec && it != end; it.increment(ec))
    {
        const std::string relative = it->path().lexically_relative(root).generic_string();

        std::error_code typeEc;
        if (it->is_directory(typeEc))
        {
            if (isExcluded(relative + "/", excludes))
                it.disable_recursion_pending();
            continue;
        }

        if (!it->is_regular_file(typeEc) || it->path().extension() != ext)
            continue;
        if (isExcluded(relative, excludes))
            continue;

        result.push_back(CollectedFile{it->path(), relative});
    }

    if (ec)
        return makeError({}, "unable to scan " + root.string() + ": " + ec.message());

    std::sort(result.begin(), result.end(), [](const CollectedFile &a, const CollectedFile &b) {
        return a.relative < b.relative;
    });
    return result;
}

} // namespace dartstrip::tools
