//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: strip/Formatter.hpp
// Purpose: Declares the blank-line normalizer applied after comment removal.
// Key invariants: Non-blank lines and lines starting inside a string literal
//                 are emitted byte for byte; only blank lines are dropped.
// Ownership/Lifetime: Returns a fresh string; the input is borrowed.
// Links: strip/Stripper.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "strip/Stripper.hpp"

#include <string>

namespace dartstrip::strip
{

/// @brief Decide which blank lines survive comment removal.
///
/// Lines that became blank because a comment was deleted on them are removed.
/// A run of pre-existing blank lines next to such a line is dropped when it
/// sits between a closing `)`/`}` and a `.` continuation, or next to a `{`,
/// a `}`, or the file boundary; otherwise it collapses to one blank line.
/// Blank runs untouched by comment removal are left alone.
///
/// @param stripped Output of strip().
/// @return Normalized text.
[[nodiscard]] std::string normalize(const StrippedText &stripped);

} // namespace dartstrip::strip
