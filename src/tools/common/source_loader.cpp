//===----------------------------------------------------------------------===//
//
// Part of the dartstrip project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/source_loader.cpp
// Purpose: Read and write whole source files with diagnostic-carrying errors.
// Key invariants: On failure the file on disk is left as it was, except when a
//                 write fails after truncation.
// Ownership/Lifetime: Stateless helpers.
// Links: src/tools/common/source_loader.hpp
//
//===----------------------------------------------------------------------===//

#include "tools/common/source_loader.hpp"

#include <fstream>
#include <new>
#include <sstream>

namespace dartstrip::tools::common
{

using dartstrip::support::Expected;
using dartstrip::support::makeError;
using dartstrip::support::SourceLoc;

Expected<std::string> loadSourceFile(const std::string &path, uint32_t fileId)
{
    const SourceLoc loc{fileId, 0, 0};

    std::ifstream in(path, std::ios::binary);
    if (!in)
        return Expected<std::string>(makeError(loc, "unable to open " + path));

    // Check file size before reading to avoid OOM on huge files.
    in.seekg(0, std::ios::end);
    auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    constexpr auto kMaxSourceSize = static_cast<std::streamoff>(256ULL * 1024 * 1024);
    if (fileSize < 0 || fileSize > kMaxSourceSize)
    {
        return Expected<std::string>(
            makeError(loc, "source file too large: " + path + " (limit: 256 MB)"));
    }

    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        if (in.bad())
            return Expected<std::string>(makeError(loc, "unable to read " + path));
        return Expected<std::string>(ss.str());
    }
    catch (const std::bad_alloc &)
    {
        return Expected<std::string>(makeError(loc, "out of memory reading " + path));
    }
}

Expected<void> writeSourceFile(const std::string &path, std::string_view text, uint32_t fileId)
{
    const SourceLoc loc{fileId, 0, 0};

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        return Expected<void>(makeError(loc, "unable to open " + path + " for writing"));

    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out)
        return Expected<void>(makeError(loc, "unable to write " + path));
    return {};
}

} // namespace dartstrip::tools::common
