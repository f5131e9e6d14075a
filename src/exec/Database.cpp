//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/Database.cpp
// Purpose: SQLite connection wrapper.
//
//===----------------------------------------------------------------------===//

#include "exec/Database.hpp"

#include <sqlite3.h>

#include <utility>

namespace reltpl::exec
{

using reltpl::support::Expected;
using reltpl::support::makeError;

namespace
{

/// @brief Finalizes a prepared statement on scope exit.
struct StatementGuard
{
    sqlite3_stmt *stmt = nullptr;

    ~StatementGuard()
    {
        if (stmt)
            sqlite3_finalize(stmt);
    }
};

bool isBlankTail(const char *tail)
{
    for (; tail && *tail; ++tail)
    {
        char c = *tail;
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r' && c != ';')
            return false;
    }
    return true;
}

} // namespace

Expected<Database> Database::open(const std::string &path)
{
    const std::string target = path.empty() ? std::string(":memory:") : path;

    sqlite3 *db = nullptr;
    int rc = sqlite3_open_v2(
        target.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK)
    {
        std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        if (db)
            sqlite3_close(db);
        return makeError({}, "cannot open database '" + target + "': " + msg);
    }
    return Database(db);
}

Database::Database(Database &&other) noexcept : db_(std::exchange(other.db_, nullptr)) {}

Database &Database::operator=(Database &&other) noexcept
{
    if (this != &other)
    {
        close();
        db_ = std::exchange(other.db_, nullptr);
    }
    return *this;
}

Database::~Database()
{
    close();
}

void Database::close()
{
    if (db_)
    {
        // sqlite3_close_v2 defers the close until outstanding statements finish.
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

std::string Database::lastError() const
{
    return db_ ? sqlite3_errmsg(db_) : "database is closed";
}

Expected<void> Database::exec(std::string_view script)
{
    if (!db_)
        return makeError({}, lastError());

    const std::string sql(script);
    char *err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK)
    {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        return makeError({}, msg);
    }
    return {};
}

Expected<std::vector<Row>> Database::query(std::string_view sql)
{
    if (!db_)
        return makeError({}, lastError());

    StatementGuard guard;
    const char *tail = nullptr;
    int rc = sqlite3_prepare_v2(
        db_, sql.data(), static_cast<int>(sql.size()), &guard.stmt, &tail);
    if (rc != SQLITE_OK)
        return makeError({}, lastError());
    if (!guard.stmt)
        return makeError({}, "empty statement");

    const char *end = sql.data() + sql.size();
    if (tail && tail < end && !isBlankTail(std::string(tail, end).c_str()))
        return makeError({}, "expected a single statement");

    std::vector<Row> rows;
    const int columns = sqlite3_column_count(guard.stmt);
    while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW)
    {
        Row row;
        row.reserve(static_cast<size_t>(columns));
        for (int i = 0; i < columns; ++i)
        {
            if (sqlite3_column_type(guard.stmt, i) == SQLITE_NULL)
            {
                row.emplace_back(std::nullopt);
                continue;
            }
            const auto *text = sqlite3_column_text(guard.stmt, i);
            const int len = sqlite3_column_bytes(guard.stmt, i);
            row.emplace_back(std::string(reinterpret_cast<const char *>(text),
                                         static_cast<size_t>(len)));
        }
        rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE)
        return makeError({}, lastError());
    return rows;
}

Expected<std::string> Database::queryText(std::string_view sql)
{
    auto rows = query(sql);
    if (!rows)
        return rows.error();

    const auto &result = rows.value();
    if (result.size() != 1 || result.front().size() != 1)
    {
        return makeError({},
                         "query returned " + std::to_string(result.size()) +
                             " row(s); expected exactly one row with one column");
    }
    return result.front().front().value_or(std::string{});
}

} // namespace reltpl::exec
