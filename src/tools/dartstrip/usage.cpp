//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "tools/dartstrip/usage.hpp"

#include "dartstrip/version.hpp"

namespace dartstrip::tools
{

void printVersion(std::ostream &os)
{
    os << "dartstrip v" << DARTSTRIP_VERSION_STR << "\n";
}

void printUsage(std::ostream &os)
{
    os << "dartstrip v" << DARTSTRIP_VERSION_STR << " - Dart comment remover\n"
       << "\n"
       << "Usage: dartstrip [options] <project-dir>\n"
       << "\n"
       << "Removes //, /// and /* */ comments from every source file under\n"
       << "<project-dir>, rewriting only the files that change.\n"
       << "\n"
       << "Options:\n"
       << "  -e, --exclude GLOB             Skip paths matching GLOB (repeatable)\n"
       << "  --no-default-excludes          Also process build/, ios/, android/,\n"
       << "                                 web/ and test/ directories\n"
       << "  --ext EXT                      File extension to process (default .dart)\n"
       << "  -j, --jobs N                   Worker threads (default: one per core)\n"
       << "  --no-colon-guard               Treat '//' after ':' as a comment\n"
       << "  -q, --quiet                    Do not list rewritten files\n"
       << "  -h, --help                     Show this help message\n"
       << "  --version                      Show version information\n"
       << "\n"
       << "Examples:\n"
       << "  dartstrip my_app               Strip every .dart file in my_app\n"
       << "  dartstrip -e '**/*.g.dart' .   Leave generated files alone\n"
       << "\n";
}

} // namespace dartstrip::tools
