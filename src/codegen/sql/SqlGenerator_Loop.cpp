//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/sql/SqlGenerator_Loop.cpp
// Purpose: Row iteration: loops, side-effect writes and their row sources.
// Key invariants: A row scope is pushed only after its source expression is
//                 generated, so a sub-query source correlates with the
//                 enclosing rows but never with itself.
//
//===----------------------------------------------------------------------===//

#include "codegen/sql/SqlGenerator.hpp"

#include "codegen/sql/SqlQuote.hpp"
#include "support/diag_codes.hpp"

namespace reltpl::codegen::sql
{

using namespace reltpl::frontends::tpl;

std::optional<std::string> SqlGenerator::openRowSource(const RowSource &src, unsigned indent)
{
    const std::string alias = "_" + std::to_string(scopes_.size() + 1) + "_" + src.name;
    for (const auto &scope : scopes_)
    {
        if (scope.alias == alias)
        {
            error(src.loc,
                  reltpl::diag::AliasCollision,
                  "row alias '" + alias + "' is already in scope");
            return std::nullopt;
        }
    }

    RowScope scope;
    scope.name = src.name;
    scope.alias = alias;

    std::string fromExpr;
    if (src.subquery)
    {
        auto sub = genSql(*src.subquery, src.loc);
        if (!sub)
            return std::nullopt;
        fromExpr = "(" + *sub + ")";
    }
    else
    {
        if (options_.requireDeclaredTables && !schema_.hasTable(src.table))
        {
            error(src.loc,
                  reltpl::diag::UnknownTable,
                  "table '" + src.table + "' is not declared by the init section");
            return std::nullopt;
        }
        if (src.orderBy && !schema_.mayHaveColumn(src.table, *src.orderBy))
        {
            error(src.loc,
                  reltpl::diag::UnknownOrderColumn,
                  "ORDER BY column '" + *src.orderBy + "' is not a column of table '" +
                      src.table + "'");
            return std::nullopt;
        }
        tables_.insert(src.table);
        fromExpr = quoteQualifiedName(src.table);
        scope.table = src.table;
    }

    scopes_.push_back(std::move(scope));

    std::string out = pad(indent) + "FROM " + fromExpr + " AS " + alias;
    if (!src.where.empty())
    {
        auto where = genSql(src.where, src.loc);
        if (!where)
        {
            scopes_.pop_back();
            return std::nullopt;
        }
        out += "\n" + pad(indent) + "WHERE " + *where;
    }
    if (src.orderBy)
    {
        out += "\n" + pad(indent) + "ORDER BY " + alias + "." + quoteIdentifier(*src.orderBy) +
               (src.direction == SortDirection::Descending ? " DESC" : " ASC");
    }
    return out;
}

std::optional<std::string> SqlGenerator::genLoop(const LoopNode &loop, unsigned indent)
{
    if (!enterNesting(loop.loc))
        return std::nullopt;
    DepthGuard guard{nesting_};

    if (loop.separator.find('\0') != std::string::npos)
    {
        error(loop.loc,
              reltpl::diag::UnsupportedLiteral,
              "separator contains a NUL byte, which SQLite string literals cannot hold");
        return std::nullopt;
    }

    auto from = openRowSource(loop.source, indent);
    if (!from)
        return std::nullopt;
    auto body = genSequence(*loop.body, indent);
    scopes_.pop_back();
    if (!body)
        return std::nullopt;

    return "(SELECT coalesce(group_concat(_pp, " + quoteLiteral(loop.separator) +
           "), '') FROM (\n" + pad(indent) + "SELECT " + *body + " AS _pp\n" + *from + "))";
}

bool SqlGenerator::genWrite(const WriteNode &write)
{
    if (!enterNesting(write.loc))
        return false;
    DepthGuard guard{nesting_};

    std::optional<std::string> from;
    if (write.source)
    {
        from = openRowSource(*write.source, 0);
        if (!from)
            return false;
    }

    auto path = genSql(write.path, write.loc);
    auto body = path ? genSequence(*write.body, 0) : std::nullopt;
    if (from)
        scopes_.pop_back();
    if (!body)
        return false;

    std::string stmt = "INSERT INTO " + quoteQualifiedName(options_.sideEffectTable) +
                       " (path, content)\nSELECT " + *path + "\n  , " + *body;
    if (from)
        stmt += "\n" + *from;
    sideEffects_.push_back(std::move(stmt));
    return true;
}

} // namespace reltpl::codegen::sql
