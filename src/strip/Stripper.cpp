//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements comment deletion over a span tree.  An Emitter walks the tree in
// document order, copying non-comment spans and maintaining the LineInfo table
// as newlines are written.  Hole bodies that lose a comment are emitted into a
// nested Emitter first so their lines can be re-laid out before insertion.
//
//===----------------------------------------------------------------------===//

#include "strip/Stripper.hpp"

#include <algorithm>
#include <utility>

namespace dartstrip::strip
{
namespace
{
[[nodiscard]] constexpr bool isBlank(char c) noexcept
{
    return c == ' ' || c == '\t';
}

[[nodiscard]] std::string_view trimLeft(std::string_view text)
{
    while (!text.empty() && (isBlank(text.front()) || text.front() == '\r'))
        text.remove_prefix(1);
    return text;
}

[[nodiscard]] std::string_view trimRight(std::string_view text)
{
    while (!text.empty() && (isBlank(text.back()) || text.back() == '\r'))
        text.remove_suffix(1);
    return text;
}

[[nodiscard]] std::string_view indentOf(std::string_view line)
{
    std::size_t n = 0;
    while (n < line.size() && isBlank(line[n]))
        ++n;
    return line.substr(0, n);
}

/// Lay out a stripped hole body; the result replaces everything between `${`
/// and `}`.  Lines starting inside a nested string are kept byte for byte and
/// lines ending inside one keep their trailing blanks.
std::string layoutHole(const StrippedText &body, std::string_view openerIndent)
{
    const std::size_t count = body.lines.size();
    const std::string_view eol =
        body.text.find("\r\n") != std::string::npos ? std::string_view("\r\n") : "\n";

    auto endsInString = [&](std::size_t i) {
        return i + 1 < count && body.lines[i + 1].startsInString;
    };
    auto lineText = [&](std::size_t i) {
        std::string_view line = body.line(i);
        if (i + 1 < count && !line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        return line;
    };

    std::string_view head = trimLeft(lineText(0));
    if (!endsInString(0))
        head = trimRight(head);
    std::string out(head);

    bool multiline = false;
    for (std::size_t i = 1; i < count; ++i)
    {
        std::string_view line = lineText(i);
        if (!body.lines[i].startsInString)
        {
            if (!endsInString(i))
                line = trimRight(line);
            if (line.empty())
                continue;
        }
        out += eol;
        out += line;
        multiline = true;
    }

    if (multiline)
    {
        out += eol;
        out += openerIndent;
    }
    return out;
}

class Emitter
{
  public:
    explicit Emitter(std::string_view source) : source_(source)
    {
        out_.text.reserve(source.size());
        out_.lines.push_back(LineInfo{});
    }

    void emitSpans(const std::vector<Span> &spans)
    {
        for (const Span &span : spans)
        {
            switch (span.kind)
            {
                case SpanKind::Code:
                case SpanKind::LiteralText:
                    copy(span.begin, span.end);
                    break;
                case SpanKind::LineComment:
                case SpanKind::DocComment:
                case SpanKind::BlockComment:
                    removeComment(span);
                    break;
                case SpanKind::StringLiteral:
                    emitString(span);
                    break;
                case SpanKind::InterpolationHole:
                    emitHole(span);
                    break;
            }
        }
    }

    StrippedText take()
    {
        return std::move(out_);
    }

  private:
    void append(std::string_view text)
    {
        for (char c : text)
        {
            out_.text.push_back(c);
            if (c == '\n')
                out_.lines.push_back(LineInfo{out_.text.size(), stringDepth_ > 0, false});
        }
    }

    void copy(std::size_t begin, std::size_t end)
    {
        if (skipTo_ > begin)
            begin = std::min(skipTo_, end);
        if (begin < end)
            append(source_.substr(begin, end - begin));
    }

    [[nodiscard]] std::string_view currentLine() const
    {
        return std::string_view(out_.text).substr(out_.lines.back().offset);
    }

    void trimLineEnd()
    {
        const std::size_t floor = out_.lines.back().offset;
        while (out_.text.size() > floor && isBlank(out_.text.back()))
            out_.text.pop_back();
    }

    void removeComment(const Span &comment)
    {
        out_.lines.back().hadComment = true;

        std::size_t after = comment.end;
        while (after < source_.size() && isBlank(source_[after]))
            ++after;

        const bool endsLine = after == source_.size() || source_[after] == '\n' ||
                              (source_[after] == '\r' && after + 1 < source_.size() &&
                               source_[after + 1] == '\n');
        if (endsLine)
        {
            trimLineEnd();
            skipTo_ = after;
            return;
        }

        // Code follows on the same line: keep a single separator at most.
        const std::string_view line = currentLine();
        if (line.empty() || isBlank(line.back()))
            skipTo_ = after;
        else if (after == comment.end && changesRawPrefix(after))
            append(" ");
    }

    /// True when joining the emitted text to source_[next...] would change
    /// whether an `r` reads as a raw string prefix.
    [[nodiscard]] bool changesRawPrefix(std::size_t next) const
    {
        const std::string_view text = out_.text;
        if (text.empty() || next >= source_.size())
            return false;

        // `r` + quote: the `r` was a plain identifier before the comment.
        if (text.back() == 'r' && isQuote(source_[next]))
            return text.size() == 1 || !isIdentifierChar(text[text.size() - 2]);

        // identifier + `r'`: the `r` was a raw prefix after the comment.
        return isIdentifierChar(text.back()) && source_[next] == 'r' &&
               next + 1 < source_.size() && isQuote(source_[next + 1]);
    }

    void emitString(const Span &literal)
    {
        copy(literal.begin, literal.bodyBegin);
        ++stringDepth_;
        emitSpans(literal.children);
        --stringDepth_;
        copy(literal.bodyEnd, literal.end);
    }

    void emitHole(const Span &hole)
    {
        copy(hole.begin, hole.bodyBegin);

        const bool lostComment = std::any_of(hole.children.begin(),
                                             hole.children.end(),
                                             [](const Span &s) { return s.isComment(); });
        if (!hole.terminated || !lostComment)
        {
            emitSpans(hole.children);
            copy(hole.bodyEnd, hole.end);
            return;
        }

        Emitter body(source_);
        body.emitSpans(hole.children);
        const std::string indent(indentOf(currentLine()));
        append(layoutHole(body.take(), indent));
        copy(hole.bodyEnd, hole.end);
    }

    std::string_view source_;
    StrippedText out_;
    int stringDepth_{0};
    std::size_t skipTo_{0};
};
} // namespace

std::string_view StrippedText::line(std::size_t index) const
{
    const std::size_t begin = lines[index].offset;
    const std::size_t end = index + 1 < lines.size() ? lines[index + 1].offset - 1 : text.size();
    return std::string_view(text).substr(begin, end - begin);
}

StrippedText strip(std::string_view source, const std::vector<Span> &spans)
{
    Emitter emitter(source);
    emitter.emitSpans(spans);
    return emitter.take();
}

} // namespace dartstrip::strip
