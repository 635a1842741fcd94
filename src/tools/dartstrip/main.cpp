//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Entry point for the `dartstrip` binary.  All work happens in runCLI so the
// tool tests can exercise the same code path with string streams.
//
//===----------------------------------------------------------------------===//

#include "tools/dartstrip/driver.hpp"

#include <iostream>

int main(int argc, char **argv)
{
    return dartstrip::tools::runCLI(argc, argv, std::cout, std::cerr);
}
