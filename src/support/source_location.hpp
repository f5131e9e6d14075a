//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Position of a token or construct inside a template file.
// Key invariants: Lines and columns count from the start of the whole
//                 template file, not of the section that holds the text.
// Ownership/Lifetime: Value type.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace reltpl::support
{

struct SourceLoc
{
    /// @brief SourceManager id of the template; 0 when the location is not
    ///        tied to a file (execution and side-effect errors).
    uint32_t file_id = 0;

    /// @brief One-based line; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column in bytes; 0 when unknown.
    uint32_t column = 0;

    [[nodiscard]] bool isValid() const
    {
        return file_id != 0;
    }

    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }
};

} // namespace reltpl::support
