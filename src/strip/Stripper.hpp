//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: strip/Stripper.hpp
// Purpose: Declares the pass that deletes comment spans and annotates the
//          resulting lines for the formatter.
// Key invariants: Only comment spans are removed; the line terminator after a
//                 comment always survives; string bodies are copied verbatim.
// Ownership/Lifetime: StrippedText owns its buffer; spans and source are
//                     borrowed for the duration of the call.
// Links: strip/Formatter.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "strip/Span.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace dartstrip::strip
{

/// @brief Per-line facts gathered while stripping.
struct LineInfo
{
    std::size_t offset{0};       ///< Offset of the line's first byte in the text.
    bool startsInString{false};  ///< Line begins inside a string literal.
    bool hadComment{false};      ///< A comment was deleted on this line.
};

/// @brief Stripped text plus one LineInfo per line.
/// @invariant lines is never empty and lines.front().offset == 0.
struct StrippedText
{
    std::string text;
    std::vector<LineInfo> lines;

    /// @brief Content of line @p index without its `\n`.
    [[nodiscard]] std::string_view line(std::size_t index) const;
};

/// @brief Delete every comment in @p spans from @p source.
///
/// Besides deleting comments the pass tidies the whitespace at each deletion
/// site: a comment that ends its line takes the blanks around it along; a
/// comment followed by code on the same line drops the blanks between itself
/// and that code.  Interpolation holes that lost a comment are re-laid out so
/// the `}` sits on its own line whenever the hole still spans several lines.
///
/// @param source Original text the spans index into.
/// @param spans Top-level spans from Scanner::scan().
/// @return Output text with line annotations.
[[nodiscard]] StrippedText strip(std::string_view source, const std::vector<Span> &spans);

} // namespace dartstrip::strip
