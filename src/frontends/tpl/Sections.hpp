//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/tpl/Sections.hpp
// Purpose: Splits template source into init, code and fini sections.
// Key invariants: Segments keep the file offset and line/column of their first
//                 byte so body diagnostics point into the original file.
// Ownership/Lifetime: TemplateSections owns copies of the section texts.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reltpl::frontends::tpl
{

/// @brief Contiguous run of template text and the position of its first byte.
struct SourceSegment
{
    std::string text;
    size_t offset = 0;
    uint32_t line = 1;
    uint32_t column = 1;
};

/// @brief Section contents of one template, in source order.
struct TemplateSections
{
    std::vector<SourceSegment> init;
    std::vector<SourceSegment> code;
    std::vector<SourceSegment> fini;

    /// @brief Init sections joined in source order.
    std::string initScript() const;

    /// @brief Fini sections joined in reverse source order.
    std::string finiScript() const;
};

/// @brief Split @p source into sections at `%% init|code|fini|done` lines.
///
/// @details Text before the first separator and after `%% done` is dropped.
/// A separator line owns its own terminator and the one before it; the final
/// line terminator of the file belongs to no section. Inside init and fini
/// sections a `%% %%` line prefix is rewritten to `%%`; inside code sections
/// the lexer handles it so offsets stay exact.
///
/// @return Sections, or std::nullopt after reporting an unknown section name.
std::optional<TemplateSections> splitSections(std::string_view source,
                                              uint32_t fileId,
                                              reltpl::support::DiagnosticEngine &diag);

} // namespace reltpl::frontends::tpl
