//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.cpp
// Purpose: Read a template file for the command-line tools.
//
//===----------------------------------------------------------------------===//

#include "tools/common/source_loader.hpp"

#include <fstream>
#include <iterator>
#include <new>

namespace reltpl::tools::common
{

using reltpl::support::Expected;
using reltpl::support::makeError;

namespace
{

constexpr std::streamoff kMaxTemplateSize = 256LL * 1024 * 1024;

} // namespace

Expected<LoadedSource> loadSourceBuffer(const std::string &path, reltpl::support::SourceManager &sm)
{
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in)
        return makeError({}, "unable to open " + path);

    const std::streamoff size = in.tellg();
    if (size < 0 || size > kMaxTemplateSize)
        return makeError({}, "template too large: " + path + " (limit: 256 MB)");
    in.seekg(0, std::ios::beg);

    LoadedSource source;
    try
    {
        source.buffer.reserve(static_cast<size_t>(size));
        source.buffer.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    catch (const std::bad_alloc &)
    {
        return makeError({}, "out of memory reading " + path);
    }
    if (in.bad())
        return makeError({}, "error reading " + path);

    source.fileId = sm.addFile(path);
    if (source.fileId == 0)
        return makeError({}, "too many source files registered");
    return Expected<LoadedSource>(std::move(source));
}

} // namespace reltpl::tools::common
