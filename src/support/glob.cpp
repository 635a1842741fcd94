//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Backtracking glob matcher.  Exclusion patterns are short and relative paths
// shallow, so the recursion depth stays bounded by the number of wildcards.
//
//===----------------------------------------------------------------------===//

#include "support/glob.hpp"

namespace dartstrip::support
{
namespace
{
bool matchFrom(std::string_view path, std::string_view pattern)
{
    while (!pattern.empty())
    {
        const char p = pattern.front();

        if (p == '*' && pattern.size() > 1 && pattern[1] == '*')
        {
            std::string_view rest = pattern.substr(2);
            if (!rest.empty() && rest.front() == '/' && matchFrom(path, rest.substr(1)))
                return true;
            for (std::size_t k = 0; k <= path.size(); ++k)
            {
                if (matchFrom(path.substr(k), rest))
                    return true;
            }
            return false;
        }

        if (p == '*')
        {
            std::string_view rest = pattern.substr(1);
            for (std::size_t k = 0; k <= path.size(); ++k)
            {
                if (matchFrom(path.substr(k), rest))
                    return true;
                if (k < path.size() && path[k] == '/')
                    break;
            }
            return false;
        }

        if (path.empty())
            return false;
        if (p == '?' ? path.front() == '/' : path.front() != p)
            return false;

        path.remove_prefix(1);
        pattern.remove_prefix(1);
    }
    return path.empty();
}
} // namespace

bool globMatch(std::string_view path, std::string_view pattern)
{
    return matchFrom(path, pattern);
}

} // namespace dartstrip::support
