//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Declares the file pipeline behind the `dartstrip` executable.  The pipeline
// and the CLI wrapper take injected streams so tests can drive a whole run
// against a temporary directory and inspect everything it printed.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Exposes the reusable processing pipeline of the dartstrip tool.
/// @details runPipeline() validates the project directory, discovers files,
///          strips them on a pool of worker threads and writes back the files
///          whose text changed.  Per-file failures become error diagnostics
///          and do not stop the remaining files.

#pragma once

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"
#include "tools/dartstrip/options.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace dartstrip::tools
{

/// @brief Outcome for one file that was rewritten or failed.
struct FileResult
{
    std::string file;     ///< Path relative to the project root.
    bool success = false; ///< False when the file could not be read or written.
};

/// @brief Summary of one pipeline run.
struct PipelineReport
{
    /// @brief Changed or failed files in discovery order; unchanged files
    ///        are not listed.
    std::vector<FileResult> results;

    /// @brief Number of files discovered and examined.
    std::size_t scanned = 0;

    /// @brief Number of files successfully rewritten.
    [[nodiscard]] std::size_t rewritten() const;
};

/// @brief Strip every matching file under @p opts.root.
///
/// @param opts Run configuration.
/// @param out Stream receiving `processed: <file>` lines unless opts.quiet.
/// @param diags Receives per-file errors and warnings in discovery order.
/// @param sm Registers every discovered file so diagnostics carry its path.
/// @return The report, or an error diagnostic when the project directory is
///         missing, invalid or cannot be walked.
dartstrip::support::Expected<PipelineReport> runPipeline(const ToolOptions &opts,
                                                         std::ostream &out,
                                                         dartstrip::support::DiagnosticEngine &diags,
                                                         dartstrip::support::SourceManager &sm);

/// @brief Execute the dartstrip CLI with injectable streams.
/// @return 0 on success; 1 on usage errors, invalid input or any file failure.
int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err);

} // namespace dartstrip::tools
