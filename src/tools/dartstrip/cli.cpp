//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/dartstrip/cli.cpp
// Purpose: Translate argv into ToolOptions.
// Key invariants: Options may appear before or after the project path; values
//                 are given as the next argument or after '='.
// Ownership/Lifetime: Stateless.
// Links: src/tools/dartstrip/cli.hpp
//
//===----------------------------------------------------------------------===//

#include "tools/dartstrip/cli.hpp"

#include <charconv>
#include <optional>
#include <string>
#include <string_view>

namespace dartstrip::tools
{
namespace
{
/// @brief Read the value of option @p name from `--name=value` or the next
///        argument, advancing @p index in the latter case.
std::optional<std::string_view> takeValue(
    int &index, int argc, char **argv, std::string_view arg, std::string_view name)
{
    if (arg.size() > name.size() && arg.substr(0, name.size()) == name &&
        arg[name.size()] == '=')
    {
        return arg.substr(name.size() + 1);
    }
    if (index + 1 >= argc)
        return std::nullopt;
    return std::string_view(argv[++index]);
}

bool matchesOption(std::string_view arg, std::string_view name)
{
    return arg == name ||
           (arg.size() > name.size() && arg.substr(0, name.size()) == name &&
            arg[name.size()] == '=');
}
} // namespace

OptionParseResult parseToolOption(int &index, int argc, char **argv, ToolOptions &opts)
{
    const std::string_view arg = argv[index];

    if (arg == "-e" || matchesOption(arg, "--exclude"))
    {
        auto value = takeValue(index, argc, argv, arg, "--exclude");
        if (!value || value->empty())
            return OptionParseResult::Error;
        opts.excludes.emplace_back(*value);
        return OptionParseResult::Parsed;
    }
    if (arg == "--no-default-excludes")
    {
        opts.useDefaultExcludes = false;
        return OptionParseResult::Parsed;
    }
    if (matchesOption(arg, "--ext"))
    {
        auto value = takeValue(index, argc, argv, arg, "--ext");
        if (!value || value->empty() || *value == ".")
            return OptionParseResult::Error;
        opts.extension = value->front() == '.' ? std::string(*value) : "." + std::string(*value);
        return OptionParseResult::Parsed;
    }
    if (arg == "-j" || matchesOption(arg, "--jobs"))
    {
        auto value = takeValue(index, argc, argv, arg, "--jobs");
        if (!value)
            return OptionParseResult::Error;
        unsigned parsed = 0;
        const char *const begin = value->data();
        const char *const end = begin + value->size();
        const auto fc = std::from_chars(begin, end, parsed);
        if (fc.ec != std::errc() || fc.ptr != end)
            return OptionParseResult::Error;
        opts.jobs = parsed;
        return OptionParseResult::Parsed;
    }
    if (arg == "--no-colon-guard")
    {
        opts.scan.colonGuard = false;
        return OptionParseResult::Parsed;
    }
    if (arg == "-q" || arg == "--quiet")
    {
        opts.quiet = true;
        return OptionParseResult::Parsed;
    }
    return OptionParseResult::NotMatched;
}

dartstrip::support::Expected<CliAction> parseArgs(int argc, char **argv, ToolOptions &opts)
{
    using dartstrip::support::makeError;

    bool haveRoot = false;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help")
            return CliAction::ShowHelp;
        if (arg == "--version")
            return CliAction::ShowVersion;

        switch (parseToolOption(i, argc, argv, opts))
        {
            case OptionParseResult::Parsed:
                continue;
            case OptionParseResult::Error:
                return makeError({}, "missing or invalid value for " + arg);
            case OptionParseResult::NotMatched:
                break;
        }

        if (arg.size() > 1 && arg[0] == '-')
            return makeError({}, "unknown option: " + arg);
        if (haveRoot)
            return makeError({}, "unexpected argument: " + arg);
        opts.root = arg;
        haveRoot = true;
    }
    return CliAction::Run;
}

} // namespace dartstrip::tools
