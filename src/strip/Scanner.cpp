//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Scanner.cpp
/// @brief Implementation of the span scanner.
///
/// @details Every step consumes at least one byte, so the main loop always
/// terminates.  All delimiters are ASCII; bytes of multi-byte UTF-8 sequences
/// never compare equal to a delimiter and flow into whichever run is open.
///
/// @see Scanner.hpp for the automaton description
///
//===----------------------------------------------------------------------===//

#include "strip/Scanner.hpp"

#include <algorithm>
#include <utility>

namespace dartstrip::strip
{

Scanner::Scanner(std::string_view source, ScanOptions options)
    : source_(source), options_(options)
{
}

std::vector<Span> Scanner::scan()
{
    pos_ = 0;
    issues_.clear();
    frames_.clear();

    Frame root;
    root.span.kind = SpanKind::Code;
    root.span.end = source_.size();
    root.span.bodyEnd = source_.size();
    frames_.push_back(std::move(root));

    while (pos_ < source_.size())
    {
        if (inString())
            stepString();
        else
            stepCode();
    }
    closeAtEnd();

    std::stable_sort(issues_.begin(),
                     issues_.end(),
                     [](const ScanIssue &a, const ScanIssue &b) { return a.offset < b.offset; });

    std::vector<Span> spans = std::move(frames_.front().span.children);
    frames_.clear();
    return spans;
}

//===----------------------------------------------------------------------===//
// Character access
//===----------------------------------------------------------------------===//

char Scanner::peek(std::size_t offset) const noexcept
{
    const std::size_t idx = pos_ + offset;
    return idx < source_.size() ? source_[idx] : '\0';
}

std::size_t Scanner::lineEnd(std::size_t from) const noexcept
{
    const std::size_t newline = source_.find('\n', from);
    if (newline == std::string_view::npos)
        return source_.size();
    if (newline > from && source_[newline - 1] == '\r')
        return newline - 1;
    return newline;
}

std::size_t Scanner::blockCommentEnd(std::size_t open)
{
    if (closes_.empty() || open < closesBase_)
        indexBlockComments(open);
    return closes_[open + 2 - closesBase_];
}

void Scanner::indexBlockComments(std::size_t from)
{
    // closes_[i - from] is where a comment body scanned from i at depth one
    // ends.  Filled right to left: a nested `/*` at i resumes at the end of
    // its own body, so every entry depends only on entries to its right.
    constexpr std::size_t npos = std::string_view::npos;
    const std::size_t size = source_.size();

    closesBase_ = from;
    closes_.assign(size + 2 - from, npos);
    for (std::size_t i = size; i-- > from;)
    {
        std::size_t &slot = closes_[i - from];
        if (i + 1 < size && source_[i] == '*' && source_[i + 1] == '/')
        {
            slot = i + 2;
        }
        else if (i + 1 < size && source_[i] == '/' && source_[i + 1] == '*')
        {
            const std::size_t inner = closes_[i + 2 - from];
            slot = inner == npos ? npos : closes_[inner - from];
        }
        else
        {
            slot = closes_[i + 1 - from];
        }
    }
}

//===----------------------------------------------------------------------===//
// Automaton steps
//===----------------------------------------------------------------------===//

void Scanner::stepCode()
{
    const char c = peek();

    if (c == '/' && peek(1) == '/')
    {
        // `///` wins over `//` so doc comments are never split.
        if (peek(2) == '/')
        {
            addComment(SpanKind::DocComment, lineEnd(pos_));
            return;
        }
        if (!options_.colonGuard || pos_ == 0 || source_[pos_ - 1] != ':')
        {
            addComment(SpanKind::LineComment, lineEnd(pos_));
            return;
        }
        pos_ += 2;
        return;
    }

    if (c == '/' && peek(1) == '*')
    {
        const std::size_t close = blockCommentEnd(pos_);
        if (close == std::string_view::npos)
        {
            issues_.push_back(ScanIssue{ScanIssueKind::UnterminatedBlockComment, pos_});
            addComment(SpanKind::BlockComment, lineEnd(pos_), false);
        }
        else
        {
            addComment(SpanKind::BlockComment, close);
        }
        return;
    }

    if (c == 'r' && isQuote(peek(1)) && !(pos_ > 0 && isIdentifierChar(source_[pos_ - 1])))
    {
        openString(pos_, pos_ + 1, true);
        return;
    }

    if (isQuote(c))
    {
        openString(pos_, pos_, false);
        return;
    }

    if (inHole())
    {
        Frame &hole = frames_.back();
        if (c == '{')
        {
            ++hole.braceDepth;
        }
        else if (c == '}')
        {
            if (hole.braceDepth == 1)
            {
                flushRun(hole, pos_);
                closeFrame(pos_, pos_ + 1);
                return;
            }
            --hole.braceDepth;
        }
    }

    ++pos_;
}

void Scanner::stepString()
{
    Frame &frame = frames_.back();
    const StringInfo info = frame.span.string;
    const char c = peek();

    if (c == '\\' && !info.raw)
    {
        // The escaped character is literal text, whatever it is.
        pos_ = std::min(pos_ + 2, source_.size());
        return;
    }

    if (c == '$' && peek(1) == '{')
    {
        openHole();
        return;
    }

    if (c == info.quote && (!info.triple || (peek(1) == c && peek(2) == c)))
    {
        const std::size_t width = info.triple ? 3 : 1;
        flushRun(frame, pos_);
        closeFrame(pos_, pos_ + width);
        return;
    }

    ++pos_;
}

void Scanner::flushRun(Frame &frame, std::size_t upTo)
{
    if (upTo <= frame.runBegin)
        return;

    Span run;
    run.kind =
        frame.span.kind == SpanKind::StringLiteral ? SpanKind::LiteralText : SpanKind::Code;
    run.begin = frame.runBegin;
    run.end = upTo;
    frame.span.children.push_back(std::move(run));
    frame.runBegin = upTo;
}

void Scanner::addComment(SpanKind kind, std::size_t end, bool terminated)
{
    Frame &frame = frames_.back();
    flushRun(frame, pos_);

    Span comment;
    comment.kind = kind;
    comment.begin = pos_;
    comment.end = end;
    comment.terminated = terminated;
    frame.span.children.push_back(std::move(comment));

    frame.runBegin = end;
    pos_ = end;
}

void Scanner::openString(std::size_t begin, std::size_t quotePos, bool raw)
{
    flushRun(frames_.back(), begin);

    const char quote = source_[quotePos];
    const bool triple = quotePos + 2 < source_.size() && source_[quotePos + 1] == quote &&
                        source_[quotePos + 2] == quote;

    Frame frame;
    frame.span.kind = SpanKind::StringLiteral;
    frame.span.begin = begin;
    frame.span.string = StringInfo{quote, triple, raw};
    frame.span.bodyBegin = quotePos + (triple ? 3 : 1);
    frame.runBegin = frame.span.bodyBegin;

    pos_ = frame.span.bodyBegin;
    frames_.push_back(std::move(frame));
}

void Scanner::openHole()
{
    flushRun(frames_.back(), pos_);

    Frame frame;
    frame.span.kind = SpanKind::InterpolationHole;
    frame.span.begin = pos_;
    frame.span.bodyBegin = pos_ + 2;
    frame.runBegin = frame.span.bodyBegin;
    frame.braceDepth = 1;

    pos_ = frame.span.bodyBegin;
    frames_.push_back(std::move(frame));
}

void Scanner::closeFrame(std::size_t bodyEnd, std::size_t end)
{
    Frame frame = std::move(frames_.back());
    frames_.pop_back();

    frame.span.bodyEnd = bodyEnd;
    frame.span.end = end;

    Frame &parent = frames_.back();
    parent.span.children.push_back(std::move(frame.span));
    parent.runBegin = end;
    pos_ = end;
}

void Scanner::closeAtEnd()
{
    const std::size_t end = source_.size();
    while (frames_.size() > 1)
    {
        Frame &top = frames_.back();
        flushRun(top, end);
        issues_.push_back(ScanIssue{top.span.kind == SpanKind::StringLiteral
                                        ? ScanIssueKind::UnterminatedString
                                        : ScanIssueKind::UnterminatedInterpolation,
                                    top.span.begin});
        top.span.terminated = false;
        closeFrame(end, end);
    }
    flushRun(frames_.front(), end);
}

} // namespace dartstrip::strip
