//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/tpl/Compiler.hpp
// Purpose: Entry points compiling a template into a CompiledQuery.
// Key invariants: A result with errors never carries query text.
// Ownership/Lifetime: CompilerResult owns its diagnostics and outputs; the
//                     SourceManager is borrowed.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/sql/CompiledQuery.hpp"
#include "frontends/tpl/Options.hpp"
#include "frontends/tpl/Sections.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace reltpl::frontends::tpl
{

struct CompilerInput
{
    /// @brief Complete template text, all sections included.
    std::string_view source;

    /// @brief Path used in diagnostics.
    std::string_view path{"<input>"};

    /// @brief Pre-registered file id; the path is registered when absent.
    std::optional<uint32_t> fileId{};
};

struct CompilerResult
{
    reltpl::support::DiagnosticEngine diagnostics{};

    uint32_t fileId{0};

    /// @brief Init, code and fini sections as split from the source.
    TemplateSections sections{};

    reltpl::codegen::sql::CompiledQuery query{};

    [[nodiscard]] bool succeeded() const;
};

/// @brief Compile template source.
///
/// @details Runs section splitting, lexing, parsing, macro resolution and SQL
/// generation. Each phase stops at its first error and later phases are
/// skipped, so a failed result holds exactly one error diagnostic.
/// Compilations share no state and may run concurrently, each with its own
/// SourceManager.
CompilerResult compile(const CompilerInput &input,
                       const CompilerOptions &options,
                       reltpl::support::SourceManager &sm);

} // namespace reltpl::frontends::tpl
