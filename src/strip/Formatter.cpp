//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements blank-line normalization.  The pass works on a vector of line
// records: residue lines are removed first (marking their blank neighbours as
// disturbed), then each maximal blank run is resolved against the emitted line
// before it and the non-blank line after it.
//
//===----------------------------------------------------------------------===//

#include "strip/Formatter.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace dartstrip::strip
{
namespace
{
struct Line
{
    std::string_view text;
    bool blank{false};
    bool residue{false};
    bool disturbed{false};
};

[[nodiscard]] constexpr bool isSpace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r';
}

[[nodiscard]] std::string_view trim(std::string_view text)
{
    while (!text.empty() && isSpace(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && isSpace(text.back()))
        text.remove_suffix(1);
    return text;
}

/// Resolve the blank run [first, last) of @p lines into @p out.
void emitRun(const std::vector<Line> &lines,
             std::size_t first,
             std::size_t last,
             const Line *prev,
             const Line *next,
             std::vector<std::string_view> &out)
{
    bool disturbed = false;
    for (std::size_t i = first; i < last; ++i)
        disturbed = disturbed || lines[i].disturbed;

    if (!disturbed)
    {
        for (std::size_t i = first; i < last; ++i)
            out.push_back(lines[i].text);
        return;
    }

    if (!prev || !next)
        return;

    const std::string_view before = trim(prev->text);
    const std::string_view after = trim(next->text);

    const char tail = before.empty() ? '\0' : before.back();
    const char lead = after.empty() ? '\0' : after.front();

    // Method chain: `foo()` / `.bar()` stay adjacent.
    if ((tail == ')' || tail == '}') && lead == '.')
        return;
    if (tail == '{' || lead == '}')
        return;

    out.push_back(lines[first].text);
}
} // namespace

std::string normalize(const StrippedText &stripped)
{
    std::size_t count = stripped.lines.size();

    // An empty tail after the final '\n' is not a line of its own.
    bool finalNewline = false;
    if (count > 1 && stripped.line(count - 1).empty() && !stripped.lines[count - 1].hadComment)
    {
        finalNewline = true;
        --count;
    }

    std::vector<Line> all;
    all.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        const LineInfo &info = stripped.lines[i];
        Line line;
        line.text = stripped.line(i);
        line.blank = !info.startsInString && trim(line.text).empty();
        line.residue = line.blank && info.hadComment;
        all.push_back(line);
    }

    std::vector<Line> lines;
    lines.reserve(all.size());
    for (std::size_t i = 0; i < all.size(); ++i)
    {
        if (all[i].residue)
        {
            if (!lines.empty() && lines.back().blank)
                lines.back().disturbed = true;
            if (i + 1 < all.size() && all[i + 1].blank)
                all[i + 1].disturbed = true;
            continue;
        }
        lines.push_back(all[i]);
    }

    std::vector<std::string_view> out;
    out.reserve(lines.size());
    const Line *prev = nullptr;
    std::size_t i = 0;
    while (i < lines.size())
    {
        if (!lines[i].blank)
        {
            out.push_back(lines[i].text);
            prev = &lines[i];
            ++i;
            continue;
        }

        std::size_t end = i;
        while (end < lines.size() && lines[end].blank)
            ++end;
        const Line *next = end < lines.size() ? &lines[end] : nullptr;
        emitRun(lines, i, end, prev, next, out);
        i = end;
    }

    std::string result;
    result.reserve(stripped.text.size());
    for (std::size_t k = 0; k < out.size(); ++k)
    {
        if (k != 0)
            result.push_back('\n');
        result.append(out[k]);
    }
    if (finalNewline && !out.empty())
        result.push_back('\n');
    return result;
}

} // namespace dartstrip::strip
