//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Scanner.hpp
/// @brief Span scanner that classifies Dart source into code, comments and
///        string literals.
///
/// @details The scanner is a pushdown automaton.  Each frame on its stack is
/// one open context:
///
/// ## Frames
///
/// - **Root**: top-level code.  Comments and string openers are recognized.
/// - **String**: the body of a string literal.  Only escapes (non-raw), `${`
///   and the closing delimiter are significant; `//` and `/*` are plain text.
/// - **Hole**: the body of `${ ... }`.  Behaves like Root, but `{` and `}`
///   are counted and the `}` that balances the opening `${` pops the frame.
///
/// Frames are kept in a vector rather than on the native call stack, so
/// `string -> hole -> string -> hole -> ...` may nest arbitrarily deep.
///
/// ## Comments
///
/// - `///` and `//` run to the end of the line (a `\r` before `\n` is not
///   part of the comment).  `//` directly after `:` is not a comment while
///   ScanOptions::colonGuard is set.
/// - `/*` nests.  When no balancing `*/` exists the comment only covers the
///   rest of its own line and scanning resumes in code on the next line.
///
/// ## Malformed input
///
/// Nothing is fatal.  Frames still open at end of file are closed there and
/// flagged unterminated; each such case is recorded as a ScanIssue.
///
/// @invariant frames_.front() is the root frame.
/// @invariant Top-level spans returned by scan() partition the source.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "dartstrip/strip/Process.hpp"
#include "strip/Span.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace dartstrip::strip
{

/// @brief Single-pass span scanner over one file.
class Scanner
{
  public:
    /// @brief Create a scanner over @p source.
    /// @param source Text to classify; must outlive the scanner and its spans.
    /// @param options Policy knobs.
    explicit Scanner(std::string_view source, ScanOptions options = {});

    /// @brief Classify the whole source.
    /// @return Top-level spans in document order.
    [[nodiscard]] std::vector<Span> scan();

    /// @brief Malformations seen during the last scan().
    [[nodiscard]] const std::vector<ScanIssue> &issues() const noexcept
    {
        return issues_;
    }

  private:
    /// @brief One open context on the automaton stack.
    struct Frame
    {
        Span span;                ///< Span under construction.
        std::size_t runBegin{0};  ///< Start of the pending Code/LiteralText run.
        int braceDepth{0};        ///< Hole frames: open braces including `${`.
    };

    //=========================================================================
    /// @name Character Access
    /// @{
    //=========================================================================

    /// @brief Character at pos_ + @p offset, or '\0' past the end.
    [[nodiscard]] char peek(std::size_t offset = 0) const noexcept;

    /// @brief Offset where the line containing @p from ends, excluding the
    ///        line terminator.
    [[nodiscard]] std::size_t lineEnd(std::size_t from) const noexcept;

    /// @brief Offset just past the `*/` balancing the `/*` at @p open.
    /// @return The offset, or npos when the comment never closes.
    [[nodiscard]] std::size_t blockCommentEnd(std::size_t open);

    /// @brief Precompute block comment ends for every offset from @p from on.
    void indexBlockComments(std::size_t from);

    /// @}

    //=========================================================================
    /// @name Automaton Steps
    /// @{
    //=========================================================================

    /// @brief Consume input while the top frame is Root or Hole.
    void stepCode();

    /// @brief Consume input while the top frame is a String.
    void stepString();

    /// @brief Emit the pending run of @p frame ending at @p upTo.
    void flushRun(Frame &frame, std::size_t upTo);

    /// @brief Record a comment span `[pos_, end)` in the top frame.
    void addComment(SpanKind kind, std::size_t end, bool terminated = true);

    /// @brief Push a String frame; @p quotePos is the first quote character.
    void openString(std::size_t begin, std::size_t quotePos, bool raw);

    /// @brief Push a Hole frame for the `${` at pos_.
    void openHole();

    /// @brief Pop the top frame, ending its span at @p end with body end
    ///        @p bodyEnd, and attach it to the new top frame.
    void closeFrame(std::size_t bodyEnd, std::size_t end);

    /// @brief Close every frame left open at end of input.
    void closeAtEnd();

    /// @}

    [[nodiscard]] bool inString() const noexcept
    {
        return frames_.back().span.kind == SpanKind::StringLiteral;
    }

    [[nodiscard]] bool inHole() const noexcept
    {
        return frames_.back().span.kind == SpanKind::InterpolationHole;
    }

    std::string_view source_;
    ScanOptions options_;
    std::size_t pos_{0};
    std::vector<Frame> frames_;
    std::vector<ScanIssue> issues_;
    std::vector<std::size_t> closes_;
    std::size_t closesBase_{0};
};

} // namespace dartstrip::strip
