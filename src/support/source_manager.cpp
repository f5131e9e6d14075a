//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.cpp
// Purpose: Template file registry used by diagnostics.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"

#include <filesystem>
#include <limits>

namespace reltpl::support
{

uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = std::filesystem::path(std::move(path)).lexically_normal().generic_string();

    if (auto it = ids_.find(normalized); it != ids_.end())
        return it->second;

    if (files_.size() >= std::numeric_limits<uint32_t>::max())
        return 0;

    files_.push_back(File{normalized, {}});
    const auto id = static_cast<uint32_t>(files_.size());
    ids_.emplace(std::move(normalized), id);
    return id;
}

void SourceManager::setText(uint32_t fileId, std::string text)
{
    if (fileId == 0 || fileId > files_.size())
        return;
    files_[fileId - 1].text = std::move(text);
}

const SourceManager::File *SourceManager::lookup(uint32_t fileId) const
{
    if (fileId == 0 || fileId > files_.size())
        return nullptr;
    return &files_[fileId - 1];
}

std::string_view SourceManager::getPath(uint32_t fileId) const
{
    const File *file = lookup(fileId);
    return file ? std::string_view(file->path) : std::string_view();
}

std::string_view SourceManager::lineText(uint32_t fileId, uint32_t line) const
{
    const File *file = lookup(fileId);
    if (!file || line == 0)
        return {};

    std::string_view text = file->text;
    size_t start = 0;
    for (uint32_t l = 1; l < line; ++l)
    {
        size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos)
            return {};
        start = nl + 1;
    }
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos)
        end = text.size();
    if (end > start && text[end - 1] == '\r')
        --end;
    return text.substr(start, end - start);
}

} // namespace reltpl::support
