//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/tpl/Schema.hpp
// Purpose: Table/column catalog scanned lexically from an init script.
// Key invariants: Names are matched case-insensitively and without their
//                 schema qualifier, as the engine does for unambiguous names.
// Ownership/Lifetime: Value type.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace reltpl::frontends::tpl
{

/// @brief Names of the tables an init script declares, and their columns.
///
/// @details The catalog is built by scanning `CREATE TABLE` and `CREATE VIEW`
/// statements; it never executes SQL. Tables created with `AS SELECT`, virtual
/// tables and views without a column list are known by name only, so column
/// checks against them are skipped.
class Schema
{
  public:
    /// @brief Scan @p sql for table and view definitions.
    static Schema fromScript(std::string_view sql);

    /// @brief Declare a table with a known column list.
    void addTable(std::string_view name, std::vector<std::string> columns);

    /// @brief Declare a table whose columns are not known.
    void addOpaqueTable(std::string_view name);

    bool hasTable(std::string_view name) const;

    /// @brief Columns of @p table, or nullptr when the table or its column
    ///        list is unknown.
    const std::vector<std::string> *columns(std::string_view table) const;

    /// @brief False only when the table's columns are known and @p column is
    ///        not among them.
    bool mayHaveColumn(std::string_view table, std::string_view column) const;

    size_t tableCount() const
    {
        return tables_.size();
    }

  private:
    struct TableInfo
    {
        std::string name;
        std::vector<std::string> columns;
        bool columnsKnown = false;
    };

    static std::string key(std::string_view name);

    std::unordered_map<std::string, TableInfo> tables_;
};

} // namespace reltpl::frontends::tpl
