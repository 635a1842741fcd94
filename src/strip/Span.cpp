//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the span naming and dump helpers.  The dump format is used by the
// scanner tests to compare whole span trees against a single expected string.
//
//===----------------------------------------------------------------------===//

#include "strip/Span.hpp"

namespace dartstrip::strip
{
namespace
{
void appendQuoted(std::string &out, std::string_view text)
{
    out.push_back('"');
    for (char c : text)
    {
        switch (c)
        {
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            default:
                out.push_back(c);
                break;
        }
    }
    out.push_back('"');
}

void dumpInto(std::string &out, std::string_view source, const std::vector<Span> &spans)
{
    bool first = true;
    for (const Span &span : spans)
    {
        if (!first)
            out.push_back(' ');
        first = false;

        out += spanKindToString(span.kind);
        switch (span.kind)
        {
            case SpanKind::StringLiteral:
                if (span.string.raw)
                    out.push_back('r');
                out.append(span.string.triple ? 3 : 1, span.string.quote);
                out.push_back('(');
                dumpInto(out, source, span.children);
                out.push_back(')');
                break;
            case SpanKind::InterpolationHole:
                out.push_back('(');
                dumpInto(out, source, span.children);
                out.push_back(')');
                break;
            default:
                appendQuoted(out, span.text(source));
                break;
        }
        if (!span.terminated)
            out.push_back('!');
    }
}
} // namespace

const char *spanKindToString(SpanKind kind)
{
    switch (kind)
    {
        case SpanKind::Code:
            return "code";
        case SpanKind::LineComment:
            return "line";
        case SpanKind::DocComment:
            return "doc";
        case SpanKind::BlockComment:
            return "block";
        case SpanKind::StringLiteral:
            return "string";
        case SpanKind::InterpolationHole:
            return "hole";
        case SpanKind::LiteralText:
            return "text";
    }
    return "";
}

std::string dumpSpans(std::string_view source, const std::vector<Span> &spans)
{
    std::string out;
    dumpInto(out, source, spans);
    return out;
}

} // namespace dartstrip::strip
