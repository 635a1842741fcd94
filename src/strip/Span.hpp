//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: strip/Span.hpp
// Purpose: Declares the classified source ranges produced by the scanner.
// Key invariants: Sibling spans are in document order, never overlap, and
//                 partition their parent's range (the whole file at top level,
//                 the body at nested levels).
// Ownership/Lifetime: A span owns its children; ranges index into the source
//                     text, which the caller keeps alive.
// Links: strip/Scanner.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dartstrip::strip
{

/// @brief Classification of a source range.
enum class SpanKind : std::uint8_t
{
    Code,              ///< Executable text outside strings and comments.
    LineComment,       ///< `//` up to the end of the line.
    DocComment,        ///< `///` up to the end of the line.
    BlockComment,      ///< Outermost `/* ... */`, nested comments included.
    StringLiteral,     ///< Whole literal including prefix and quotes.
    InterpolationHole, ///< `${ ... }` inside a string literal.
    LiteralText        ///< Run of plain characters in a string body.
};

/// @brief Delimiter shape of a string literal.
struct StringInfo
{
    char quote{'\''};   ///< Either `'` or `"`.
    bool triple{false}; ///< Delimited by three quote characters.
    bool raw{false};    ///< Prefixed with `r`; escapes are not interpreted.
};

/// @brief Half-open range `[begin, end)` over the source with its kind.
/// @details StringLiteral and InterpolationHole spans additionally carry a body
///          range between their delimiters; their children partition that body.
///          Unterminated strings, holes and block comments end at end of file
///          (block comments: at end of line) with `terminated` cleared.
struct Span
{
    SpanKind kind{SpanKind::Code};
    std::size_t begin{0};
    std::size_t end{0};
    std::size_t bodyBegin{0};
    std::size_t bodyEnd{0};
    bool terminated{true};
    StringInfo string{};
    std::vector<Span> children;

    /// @brief True for the three comment kinds.
    [[nodiscard]] bool isComment() const noexcept
    {
        return kind == SpanKind::LineComment || kind == SpanKind::DocComment ||
               kind == SpanKind::BlockComment;
    }

    /// @brief View of the covered text inside @p source.
    [[nodiscard]] std::string_view text(std::string_view source) const
    {
        return source.substr(begin, end - begin);
    }
};

/// @brief True for the two string delimiters.
[[nodiscard]] constexpr bool isQuote(char c) noexcept
{
    return c == '\'' || c == '"';
}

/// @brief True for bytes that may continue a Dart identifier.
/// @details An `r` directly before a quote is a raw prefix only when this
///          does not hold for the byte before the `r`.
[[nodiscard]] constexpr bool isIdentifierChar(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '$';
}

/// @brief Short lowercase name for @p kind.
const char *spanKindToString(SpanKind kind);

/// @brief Render @p spans as a compact one-line tree, e.g.
///        `code"x = " string'(text"a" hole(code"b")) code";"`.
std::string dumpSpans(std::string_view source, const std::vector<Span> &spans);

} // namespace dartstrip::strip
