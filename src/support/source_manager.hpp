//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Registry of template files named in diagnostics, with their text
//          for printing the offending line.
// Key invariants: Ids start at 1; an id never changes meaning once assigned.
// Ownership/Lifetime: Owns paths and template text; returned views stay
//                     valid until the manager is destroyed or the text of
//                     that file is replaced.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace reltpl::support
{

class SourceManager
{
  public:
    /// @brief Register @p path and return its id.
    /// @details Paths are compared after lexical normalisation, so `a/./t.tpl`
    ///          and `a/t.tpl` share an id.
    /// @return The id, or 0 once the id space is exhausted.
    uint32_t addFile(std::string path);

    /// @brief Attach the template text of @p fileId for source snippets.
    void setText(uint32_t fileId, std::string text);

    /// @brief Normalised path of @p fileId; empty for unknown ids.
    std::string_view getPath(uint32_t fileId) const;

    /// @brief Line @p line (1-based) of the text of @p fileId without its
    ///        line terminator; empty when the text or line is unknown.
    std::string_view lineText(uint32_t fileId, uint32_t line) const;

    size_t fileCount() const
    {
        return files_.size();
    }

  private:
    struct File
    {
        std::string path;
        std::string text;
    };

    const File *lookup(uint32_t fileId) const;

    /// Entry i holds id i + 1; a deque keeps path views stable while growing.
    std::deque<File> files_;
    std::unordered_map<std::string, uint32_t> ids_;
};

} // namespace reltpl::support
