//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.hpp
// Purpose: Whole-file read and write helpers used by the dartstrip pipeline.
// Key invariants: Files are read and written in binary mode, so line endings
//                 and encodings pass through untouched.
// Ownership/Lifetime: Returned buffers are owned by the caller.
// Links: tools/dartstrip/driver.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace dartstrip::tools::common
{

/// @brief Read @p path into memory.
///
/// Files larger than 256 MB are rejected before any allocation.
///
/// @param path Filesystem path to the source file.
/// @param fileId SourceManager identifier attached to failure diagnostics.
/// @return File contents, or an error diagnostic naming the failure.
dartstrip::support::Expected<std::string> loadSourceFile(const std::string &path,
                                                         uint32_t fileId = 0);

/// @brief Replace the contents of @p path with @p text.
/// @param fileId SourceManager identifier attached to failure diagnostics.
/// @return Success, or an error diagnostic when the file cannot be written.
dartstrip::support::Expected<void> writeSourceFile(const std::string &path,
                                                   std::string_view text,
                                                   uint32_t fileId = 0);

} // namespace dartstrip::tools::common
