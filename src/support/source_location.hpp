//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the file/line/column triple attached to diagnostics.
// Key invariants: file_id == 0 denotes an unknown file; line/column are
//                 1-based when present and 0 when unknown.
// Ownership/Lifetime: Value type with no dynamic ownership.
// Links: support/source_manager.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace dartstrip::support
{

/// @brief Position inside a file registered with a SourceManager.
/// @invariant file_id == 0 indicates an unknown location.
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 when unknown.
    uint32_t file_id = 0;

    /// @brief One-based line number; 0 when the diagnostic covers a whole file.
    uint32_t line = 0;

    /// @brief One-based column in Unicode scalar values; 0 when unknown.
    uint32_t column = 0;

    /// @brief Check whether the location names a registered file.
    [[nodiscard]] bool isValid() const;

    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }
};

} // namespace dartstrip::support
