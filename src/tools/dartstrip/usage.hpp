//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>

namespace dartstrip::tools
{

void printVersion(std::ostream &os);

void printUsage(std::ostream &os);

} // namespace dartstrip::tools
