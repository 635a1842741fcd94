//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/dartstrip/driver.cpp
// Purpose: Discover, strip and rewrite the files of one project.
// Key invariants: Workers share nothing but the read-only file list and an
//                 atomic cursor; each writes only its own outcome slot.
//                 Output and diagnostics are emitted in discovery order after
//                 every worker has joined.
// Ownership/Lifetime: All state is local to one runPipeline() call.
// Links: src/tools/dartstrip/driver.hpp
//
//===----------------------------------------------------------------------===//

#include "tools/dartstrip/driver.hpp"

#include "dartstrip/strip/Process.hpp"
#include "tools/common/source_loader.hpp"
#include "tools/dartstrip/cli.hpp"
#include "tools/dartstrip/file_collector.hpp"
#include "tools/dartstrip/usage.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <ostream>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace dartstrip::tools
{

using dartstrip::support::Diagnostic;
using dartstrip::support::DiagnosticEngine;
using dartstrip::support::Expected;
using dartstrip::support::makeError;
using dartstrip::support::makeWarning;
using dartstrip::support::SourceManager;

namespace
{
/// @brief What happened to one file; filled by exactly one worker.
struct FileOutcome
{
    bool changed = false;
    bool failed = false;
    std::vector<Diagnostic> diags;
};

FileOutcome processFile(const CollectedFile &file, uint32_t fileId, const strip::ScanOptions &scan)
{
    FileOutcome outcome;
    const std::string path = file.path.string();

    auto text = common::loadSourceFile(path, fileId);
    if (!text)
    {
        outcome.failed = true;
        outcome.diags.push_back(text.error());
        return outcome;
    }

    const strip::ProcessResult result = strip::process(text.value(), scan);
    for (const strip::ScanIssue &issue : result.issues)
    {
        const strip::TextPosition pos = strip::positionOf(text.value(), issue.offset);
        outcome.diags.push_back(
            makeWarning({fileId, pos.line, pos.column}, strip::scanIssueToString(issue.kind)));
    }

    if (!result.changed)
        return outcome;

    auto written = common::writeSourceFile(path, result.outputText, fileId);
    if (!written)
    {
        outcome.failed = true;
        outcome.diags.push_back(written.error());
        return outcome;
    }
    outcome.changed = true;
    return outcome;
}

unsigned workerCount(unsigned requested, std::size_t files)
{
    unsigned jobs = requested != 0 ? requested : std::thread::hardware_concurrency();
    jobs = std::max(jobs, 1u);
    if (files < jobs)
        jobs = static_cast<unsigned>(files);
    return jobs;
}
} // namespace

std::size_t PipelineReport::rewritten() const
{
    return static_cast<std::size_t>(std::count_if(
        results.begin(), results.end(), [](const FileResult &r) { return r.success; }));
}

Expected<PipelineReport> runPipeline(const ToolOptions &opts,
                                     std::ostream &out,
                                     DiagnosticEngine &diags,
                                     SourceManager &sm)
{
    if (opts.root.empty())
        return makeError({}, "project path is required");

    const fs::path root(opts.root);
    std::error_code ec;
    if (!fs::exists(root, ec))
        return makeError({}, opts.root + " does not exist");
    if (!fs::is_directory(root, ec))
        return makeError({}, opts.root + " is not a directory");

    auto collected = collectFiles(root, opts.extension, opts.effectiveExcludes());
    if (!collected)
        return collected.error();
    const std::vector<CollectedFile> &files = collected.value();

    PipelineReport report;
    report.scanned = files.size();
    if (files.empty())
    {
        diags.report(makeWarning({}, "no " + opts.extension + " files found in " + opts.root));
        return report;
    }

    // SourceManager is not synchronized: register everything up front.
    std::vector<uint32_t> fileIds;
    fileIds.reserve(files.size());
    for (const CollectedFile &file : files)
    {
        const uint32_t id = sm.addFile(file.path.string());
        if (id == 0)
            return makeError({}, "source manager exhausted file identifier space");
        fileIds.push_back(id);
    }

    std::vector<FileOutcome> outcomes(files.size());
    std::atomic<std::size_t> cursor{0};
    auto worker = [&]() {
        for (std::size_t i = cursor.fetch_add(1); i < files.size(); i = cursor.fetch_add(1))
            outcomes[i] = processFile(files[i], fileIds[i], opts.scan);
    };

    const unsigned jobs = workerCount(opts.jobs, files.size());
    std::vector<std::thread> pool;
    pool.reserve(jobs);
    for (unsigned j = 1; j < jobs; ++j)
    {
        try
        {
            pool.emplace_back(worker);
        }
        catch (const std::system_error &)
        {
            // Out of threads: the ones already running plus this one finish the work.
            break;
        }
    }
    worker();
    for (std::thread &t : pool)
        t.join();

    for (std::size_t i = 0; i < files.size(); ++i)
    {
        FileOutcome &outcome = outcomes[i];
        for (Diagnostic &d : outcome.diags)
            diags.report(std::move(d));

        if (outcome.failed)
        {
            report.results.push_back(FileResult{files[i].relative, false});
            continue;
        }
        if (!outcome.changed)
            continue;

        report.results.push_back(FileResult{files[i].relative, true});
        if (!opts.quiet)
            out << "processed: " << files[i].relative << "\n";
    }
    return report;
}

int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err)
{
    ToolOptions opts;
    auto action = parseArgs(argc, argv, opts);
    if (!action)
    {
        dartstrip::support::printDiag(action.error(), err);
        printUsage(err);
        return 1;
    }

    switch (action.value())
    {
        case CliAction::ShowHelp:
            printUsage(out);
            return 0;
        case CliAction::ShowVersion:
            printVersion(out);
            return 0;
        case CliAction::Run:
            break;
    }

    SourceManager sm;
    DiagnosticEngine diags;
    auto report = runPipeline(opts, out, diags, sm);
    diags.printAll(err, &sm);
    if (!report)
    {
        dartstrip::support::printDiag(report.error(), err, &sm);
        return 1;
    }

    out << "removed comments from " << report.value().rewritten() << " of "
        << report.value().scanned << " files\n";
    return diags.errorCount() == 0 ? 0 : 1;
}

} // namespace dartstrip::tools
