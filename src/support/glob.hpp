//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/glob.hpp
// Purpose: Declares path-aware glob matching for exclusion patterns.
// Key invariants: Paths use '/' separators; matching is case-sensitive.
// Ownership/Lifetime: Stateless.
// Links: tools/dartstrip/file_collector.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace dartstrip::support
{

/// @brief Test whether @p path matches glob @p pattern.
///
/// Pattern syntax:
/// - `*` matches any run of characters except '/'.
/// - `**` matches any run of characters including '/'; `**/` may also match
///   zero directories, so `**/build/**` matches `build/x` and `a/build/x`.
/// - `?` matches exactly one character except '/'.
/// - Every other character matches itself.
///
/// The whole path must match.
[[nodiscard]] bool globMatch(std::string_view path, std::string_view pattern);

} // namespace dartstrip::support
