//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/Harness.cpp
// Purpose: Stage sequencing for template execution.
//
//===----------------------------------------------------------------------===//

#include "exec/Harness.hpp"

#include "codegen/sql/SqlQuote.hpp"
#include "support/diag_codes.hpp"

namespace reltpl::exec
{

using reltpl::support::Diag;
using reltpl::support::Expected;
using reltpl::support::makeError;

namespace
{

std::string_view stageCode(Stage stage)
{
    switch (stage)
    {
        case Stage::Init:
            return reltpl::diag::InitFailed;
        case Stage::Body:
            return reltpl::diag::BodyFailed;
        case Stage::Fini:
            return reltpl::diag::FiniFailed;
    }
    return reltpl::diag::BodyFailed;
}

Diag stageError(Stage stage, const std::string &message)
{
    return makeError({}, std::string(stageName(stage)) + ": " + message, stageCode(stage));
}

/// @brief `PRAGMA [schema.]table_info('name')` for a possibly qualified name.
std::string tableInfoPragma(const std::string &table)
{
    using reltpl::codegen::sql::quoteIdentifier;
    using reltpl::codegen::sql::quoteLiteral;

    auto dot = table.find('.');
    if (dot == std::string::npos)
        return "PRAGMA table_info(" + quoteLiteral(table) + ")";
    return "PRAGMA " + quoteIdentifier(table.substr(0, dot)) + ".table_info(" +
           quoteLiteral(table.substr(dot + 1)) + ")";
}

Expected<void> checkTables(Database &db, const reltpl::codegen::sql::CompiledQuery &query)
{
    for (const auto &table : query.tables)
    {
        auto rows = db.query(tableInfoPragma(table));
        if (!rows)
            return rows.error();
        if (rows.value().empty())
            return makeError({}, "no such table: " + table);
    }
    return {};
}

Expected<std::string> runBody(Database &db, const reltpl::codegen::sql::CompiledQuery &query)
{
    auto tables = checkTables(db, query);
    if (!tables)
        return tables.error();

    for (const auto &stmt : query.sideEffects)
    {
        auto r = db.exec(stmt);
        if (!r)
            return r.error();
    }
    return db.queryText(query.text);
}

} // namespace

const char *stageName(Stage stage)
{
    switch (stage)
    {
        case Stage::Init:
            return "init";
        case Stage::Body:
            return "body";
        case Stage::Fini:
            return "fini";
    }
    return "unknown";
}

Expected<RenderResult> render(ExecContext &ctx,
                              const reltpl::codegen::sql::CompiledQuery &query,
                              std::string_view initScript,
                              std::string_view finiScript,
                              const HarnessOptions &options)
{
    Database &db = ctx.database();

    if (auto init = db.exec(initScript); !init)
        return stageError(Stage::Init, init.error().message);

    auto body = runBody(db, query);
    if (!body)
    {
        std::string message = body.error().message;
        if (options.runFiniOnBodyFailure)
        {
            if (auto fini = db.exec(finiScript); !fini)
                message += " (fini also failed: " + fini.error().message + ")";
        }
        return stageError(Stage::Body, message);
    }

    if (auto fini = db.exec(finiScript); !fini)
        return stageError(Stage::Fini, fini.error().message);

    const std::string select = "SELECT path, content FROM sys." +
                               reltpl::codegen::sql::quoteIdentifier(ctx.sideEffectTable()) +
                               " ORDER BY rowid";
    auto rows = db.query(select);
    if (!rows)
        return stageError(Stage::Fini, rows.error().message);

    RenderResult result;
    result.output = std::move(body.value());
    for (auto &row : rows.value())
    {
        SideEffectRecord record;
        record.path = row[0].value_or(std::string{});
        record.content = row[1].value_or(std::string{});
        result.sideEffects.push_back(std::move(record));
    }
    return Expected<RenderResult>(std::move(result));
}

std::string buildScript(const std::string &sysDatabasePath,
                        const std::string &sideEffectTable,
                        const reltpl::codegen::sql::CompiledQuery &query,
                        std::string_view initScript,
                        std::string_view finiScript)
{
    std::string script = sysSetupScript(sysDatabasePath, sideEffectTable);
    script += initScript;
    if (!script.empty() && script.back() != '\n')
        script += '\n';
    for (const auto &stmt : query.sideEffects)
        script += stmt + ";\n";
    script += query.text + ";\n";
    script += finiScript;
    if (!script.empty() && script.back() != '\n')
        script += '\n';
    return script;
}

} // namespace reltpl::exec
