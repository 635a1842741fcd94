//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/dartstrip/strip/Process.hpp
// Purpose: Public entry point that removes comments from one Dart source text.
// Key invariants: process() is pure and total; it never throws for decodable
//                 text and never performs I/O.
// Ownership/Lifetime: Results own their output buffers; inputs are borrowed.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Declares the comment-removal pipeline used by the dartstrip tool.
/// @details The pipeline runs the span scanner, the comment stripper, and the
///          blank-line formatter over a single file's text.  File discovery and
///          write-back live in the tool layer; everything declared here works on
///          in-memory text only so it can be called from any number of threads.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dartstrip::strip
{

/// @brief Tunable scanning policy.
struct ScanOptions
{
    /// @brief Do not start a line comment at `//` directly preceded by `:`.
    /// @details Keeps fragments such as `label://x` that appear in code intact.
    bool colonGuard{true};
};

/// @brief Malformed constructs the scanner tolerated while reading a file.
enum class ScanIssueKind
{
    UnterminatedBlockComment, ///< `/*` without a matching `*/`.
    UnterminatedString,       ///< String literal still open at end of file.
    UnterminatedInterpolation ///< `${` still open at end of file.
};

/// @brief One tolerated malformation, located by byte offset.
struct ScanIssue
{
    ScanIssueKind kind{ScanIssueKind::UnterminatedBlockComment};
    std::size_t offset{0}; ///< Byte offset of the opening delimiter.
};

/// @brief Human-readable description of @p kind.
const char *scanIssueToString(ScanIssueKind kind);

/// @brief Outcome of removing comments from one file's text.
struct ProcessResult
{
    std::string outputText;        ///< Text with comments removed and blank lines normalized.
    bool changed{false};           ///< True when outputText differs from the input.
    std::vector<ScanIssue> issues; ///< Malformed constructs seen while scanning.
};

/// @brief One-based line/column pair; the column counts Unicode scalar values.
struct TextPosition
{
    std::uint32_t line{1};
    std::uint32_t column{1};
};

/// @brief Remove every comment from @p fileText.
/// @param fileText UTF-8 Dart source.
/// @param options Scanner policy knobs.
/// @return Rewritten text plus a change flag.
[[nodiscard]] ProcessResult process(std::string_view fileText, const ScanOptions &options = {});

/// @brief Translate a byte offset into a line/column pair.
/// @details Columns skip UTF-8 continuation bytes so a wide glyph counts once.
[[nodiscard]] TextPosition positionOf(std::string_view text, std::size_t offset);

} // namespace dartstrip::strip
