//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/Database.hpp
// Purpose: RAII wrapper over a SQLite connection.
// Key invariants: A Database owns exactly one open connection or none after
//                 being moved from.
// Ownership/Lifetime: The connection closes when the object is destroyed.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;

namespace reltpl::exec
{

/// @brief One column value; SQL NULL is std::nullopt.
using Value = std::optional<std::string>;

/// @brief One result row.
using Row = std::vector<Value>;

class Database
{
  public:
    /// @brief Open (creating if needed) the database at @p path.
    /// @details An empty path or ":memory:" opens a private in-memory database.
    static reltpl::support::Expected<Database> open(const std::string &path);

    Database(Database &&other) noexcept;
    Database &operator=(Database &&other) noexcept;
    Database(const Database &) = delete;
    Database &operator=(const Database &) = delete;
    ~Database();

    /// @brief Run every statement of @p script, discarding result rows.
    reltpl::support::Expected<void> exec(std::string_view script);

    /// @brief Run the single statement @p sql and collect its rows.
    /// @details Trailing whitespace and semicolons are accepted; any further
    ///          statement is an error.
    reltpl::support::Expected<std::vector<Row>> query(std::string_view sql);

    /// @brief Run @p sql and return the text of its only row and column.
    /// @details NULL is returned as an empty string.
    reltpl::support::Expected<std::string> queryText(std::string_view sql);

    /// @brief Close the connection; later calls fail with an error.
    void close();

  private:
    explicit Database(sqlite3 *db) : db_(db) {}

    std::string lastError() const;

    sqlite3 *db_ = nullptr;
};

} // namespace reltpl::exec
