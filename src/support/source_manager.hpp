//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares the registry mapping file identifiers to display paths.
// Key invariants: File ID 0 is invalid; registering the same normalized path
//                 twice yields the same identifier.
// Ownership/Lifetime: Manager owns the path strings; views returned by
//                     getPath() live as long as the manager.
// Links: support/diag_expected.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace dartstrip::support
{

/// @brief Maps numeric file identifiers to the paths printed in diagnostics.
/// @details Not synchronized: register every file before worker threads start,
///          after which concurrent getPath() calls are safe.
class SourceManager
{
  public:
    /// @brief Register @p path and return its identifier.
    /// @param path Path as it should appear in diagnostics.
    /// @return Identifier > 0, or 0 when the identifier space is exhausted.
    uint32_t addFile(std::string path);

    /// @brief Retrieve the path registered under @p file_id.
    /// @return Stored path, or an empty view for unknown identifiers.
    std::string_view getPath(uint32_t file_id) const;

    /// @brief Number of registered files.
    [[nodiscard]] std::size_t size() const
    {
        return files_.size();
    }

  private:
    /// Index i holds the path for identifier i + 1; deque keeps views stable.
    std::deque<std::string> files_;
    uint64_t next_file_id_ = 1;
    std::unordered_map<std::string, uint32_t> path_to_id_;
};

} // namespace dartstrip::support
