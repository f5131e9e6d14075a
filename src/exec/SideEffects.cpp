//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/SideEffects.cpp
// Purpose: Side-effect file materialisation.
//
//===----------------------------------------------------------------------===//

#include "exec/SideEffects.hpp"

#include "support/diag_codes.hpp"

#include <filesystem>
#include <fstream>
#include <set>
#include <string_view>

namespace reltpl::exec
{

using reltpl::support::Expected;
using reltpl::support::makeError;
namespace fs = std::filesystem;

namespace
{

bool isPathChar(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.' || c == '/';
}

/// @brief True when a `/`-separated component of @p path is `.` or `..`.
bool hasDotComponent(const std::string &path)
{
    size_t start = 0;
    while (start <= path.size())
    {
        size_t end = path.find('/', start);
        if (end == std::string::npos)
            end = path.size();
        const std::string_view part(path.data() + start, end - start);
        if (part == "." || part == "..")
            return true;
        start = end + 1;
    }
    return false;
}

reltpl::support::Diag pathError(const std::string &message)
{
    return makeError({}, message, reltpl::diag::InvalidOutputPath);
}

} // namespace

Expected<std::string> validateOutputPath(const std::string &path)
{
    if (path.empty())
        return pathError("side-effect path must not be empty");
    for (char c : path)
    {
        if (!isPathChar(c))
            return pathError("side-effect path has invalid character: '" + path + "'");
    }
    if (path.front() == '/')
        return pathError("side-effect path must be relative: '" + path + "'");
    if (hasDotComponent(path))
        return pathError("side-effect path must not use . or .. segments: '" + path + "'");

    std::string normal = fs::path(path).lexically_normal().generic_string();
    while (normal.size() > 1 && normal.back() == '/')
        normal.pop_back();
    if (normal.empty() || fs::path(normal).is_absolute() || normal.find(':') != std::string::npos)
        return pathError("invalid or unsafe side-effect path: '" + normal + "'");
    return normal;
}

Expected<void> materialize(const std::vector<SideEffectRecord> &records,
                           const std::string &prefix,
                           bool quiet,
                           std::ostream &log)
{
    std::vector<std::string> normalized;
    normalized.reserve(records.size());
    for (const auto &record : records)
    {
        auto path = validateOutputPath(record.path);
        if (!path)
            return path.error();
        normalized.push_back(std::move(path.value()));
    }

    if (prefix.empty())
    {
        if (!records.empty())
            log << "Warning: sys_Write files will not be written unless `--prefix PREFIX` "
                   "is specified.\n";
        return {};
    }

    std::set<fs::path> dirs;
    for (const auto &path : normalized)
        dirs.insert((fs::path(prefix) / path).parent_path());

    for (const auto &dir : dirs)
    {
        std::error_code ec;
        if (dir.empty() || fs::exists(dir, ec))
            continue;
        if (!fs::create_directories(dir, ec) && ec)
        {
            return makeError({}, "cannot create directory " + dir.string() + ": " + ec.message(),
                             reltpl::diag::OutputWriteFailed);
        }
        if (!quiet)
            log << "Creating directory: " << dir.string() << "\n";
    }

    for (size_t i = 0; i < records.size(); ++i)
    {
        const fs::path target = fs::path(prefix) / normalized[i];
        if (!quiet)
            log << "Writing: " << target.string() << "\n";
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << records[i].content;
        out.close();
        if (!out)
        {
            return makeError({}, "cannot write " + target.string(),
                             reltpl::diag::OutputWriteFailed);
        }
    }
    return {};
}

} // namespace reltpl::exec
