//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/sql/SqlQuote.hpp
// Purpose: Quoting helpers for embedding text and names in SQLite queries.
// Key invariants: quoteLiteral always yields an expression of TEXT type.
// Ownership/Lifetime: Stateless free functions.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>

namespace reltpl::codegen::sql
{

/// @brief Quote @p text as a SQLite string expression.
/// @details Single quotes are doubled. Line breaks cannot appear inside a
/// literal in generated output, so `\n` and `\r` become `x'0a'` / `x'0d'`
/// joined with `||`. The caller must reject NUL bytes first.
std::string quoteLiteral(std::string_view text);

/// @brief Quote a column or table name: `"name"` with `"` doubled.
std::string quoteIdentifier(std::string_view name);

/// @brief Quote a possibly schema-qualified name such as `sys.sys_Write`.
std::string quoteQualifiedName(std::string_view name);

/// @brief Escape `%` for use in a printf() format string.
std::string escapeFormat(std::string_view text);

} // namespace reltpl::codegen::sql
