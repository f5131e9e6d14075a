//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/Harness.hpp
// Purpose: Runs a compiled template against a database.
// Key invariants: Stages run strictly as init, body, fini. A failed init
//                 never reaches the body. Errors carry the stage's code.
// Ownership/Lifetime: The harness borrows the ExecContext for one call.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/sql/CompiledQuery.hpp"
#include "exec/ExecContext.hpp"
#include "support/diag_expected.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace reltpl::exec
{

enum class Stage
{
    Init,
    Body,
    Fini
};

const char *stageName(Stage stage);

struct HarnessOptions
{
    /// @brief Run the fini script even when the body query failed.
    bool runFiniOnBodyFailure{true};
};

/// @brief One row of the side-effect table.
struct SideEffectRecord
{
    std::string path;
    std::string content;
};

struct RenderResult
{
    /// @brief Text produced by the body query.
    std::string output;

    /// @brief Side-effect rows in insertion order.
    std::vector<SideEffectRecord> sideEffects;
};

/// @brief Execute @p query between @p initScript and @p finiScript.
///
/// @details Order: init; a check that every table the query reads exists;
/// side-effect statements; the body query, which must yield exactly one row
/// with one column; fini; read back the side-effect table. A body failure
/// still runs fini unless disabled in @p options; the body error is then
/// reported, with any fini failure appended to its message.
reltpl::support::Expected<RenderResult> render(ExecContext &ctx,
                                               const reltpl::codegen::sql::CompiledQuery &query,
                                               std::string_view initScript,
                                               std::string_view finiScript,
                                               const HarnessOptions &options = {});

/// @brief The complete SQL script a render executes, for display.
std::string buildScript(const std::string &sysDatabasePath,
                        const std::string &sideEffectTable,
                        const reltpl::codegen::sql::CompiledQuery &query,
                        std::string_view initScript,
                        std::string_view finiScript);

} // namespace reltpl::exec
