//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/sql/CompiledQuery.hpp
// Purpose: Output of the code generator, handed unchanged to the harness.
// Key invariants: text evaluates to exactly one row with one TEXT column.
// Ownership/Lifetime: Value type.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <set>
#include <string>
#include <vector>

namespace reltpl::codegen::sql
{

struct CompiledQuery
{
    /// @brief `SELECT <expr> AS _pp` rendering the template body.
    std::string text;

    /// @brief Tables the query and side-effect statements read, as written in
    ///        the template.
    std::set<std::string> tables;

    /// @brief `INSERT INTO sys_Write ...` statements in source order; run
    ///        before @ref text.
    std::vector<std::string> sideEffects;
};

} // namespace reltpl::codegen::sql
