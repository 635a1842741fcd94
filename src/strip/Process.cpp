//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Wires the scanner, stripper and formatter into the public process() call.
//
//===----------------------------------------------------------------------===//

#include "dartstrip/strip/Process.hpp"

#include "strip/Formatter.hpp"
#include "strip/Scanner.hpp"
#include "strip/Stripper.hpp"

#include <algorithm>

namespace dartstrip::strip
{

const char *scanIssueToString(ScanIssueKind kind)
{
    switch (kind)
    {
        case ScanIssueKind::UnterminatedBlockComment:
            return "unterminated block comment";
        case ScanIssueKind::UnterminatedString:
            return "unterminated string literal";
        case ScanIssueKind::UnterminatedInterpolation:
            return "unterminated string interpolation";
    }
    return "unknown scan issue";
}

ProcessResult process(std::string_view fileText, const ScanOptions &options)
{
    Scanner scanner(fileText, options);
    const std::vector<Span> spans = scanner.scan();

    ProcessResult result;
    result.outputText = normalize(strip(fileText, spans));
    result.changed = result.outputText != fileText;
    result.issues = scanner.issues();
    return result;
}

TextPosition positionOf(std::string_view text, std::size_t offset)
{
    TextPosition pos;
    const std::size_t end = std::min(offset, text.size());
    for (std::size_t i = 0; i < end; ++i)
    {
        const auto byte = static_cast<unsigned char>(text[i]);
        if (byte == '\n')
        {
            ++pos.line;
            pos.column = 1;
        }
        else if ((byte & 0xC0) != 0x80)
        {
            ++pos.column;
        }
    }
    return pos;
}

} // namespace dartstrip::strip
