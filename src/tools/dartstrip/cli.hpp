//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/dartstrip/cli.hpp
// Purpose: Command-line parsing for the dartstrip tool.
// Key invariants: Parsing never touches the filesystem; path validation is
//                 the pipeline's job.
// Ownership/Lifetime: Borrows argv for the duration of the call.
// Links: src/tools/dartstrip/options.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "tools/dartstrip/options.hpp"

namespace dartstrip::tools
{

/// @brief What the caller should do after a successful parse.
enum class CliAction
{
    Run,        ///< Process the project in ToolOptions::root.
    ShowHelp,   ///< Print usage and exit successfully.
    ShowVersion ///< Print the version banner and exit successfully.
};

/// @brief Result of attempting to parse a single option.
enum class OptionParseResult
{
    NotMatched, ///< Argument is not a known option.
    Parsed,     ///< Argument consumed and reflected in the options.
    Error       ///< Argument is a known option but its value is missing or bad.
};

/// @brief Parse the option at argv[@p index] into @p opts.
/// @param index Current argument; advanced past any consumed value.
OptionParseResult parseToolOption(int &index, int argc, char **argv, ToolOptions &opts);

/// @brief Parse a full command line (argv[0] is the program name).
/// @return The requested action, or an error diagnostic for unknown options,
///         malformed values and surplus positional arguments.
dartstrip::support::Expected<CliAction> parseArgs(int argc, char **argv, ToolOptions &opts);

} // namespace dartstrip::tools
