//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/ExecContext.hpp
// Purpose: Database connection and side-effect table for one render.
// Key invariants: After create() succeeds the `sys` database is attached and
//                 holds an empty side-effect table.
// Ownership/Lifetime: The context owns its connection and, when no side-effect
//                     database path was supplied, a private temporary
//                     directory removed on destruction.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "exec/Database.hpp"
#include "support/diag_expected.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace reltpl::exec
{

struct ExecContextOptions
{
    /// @brief Main database file; empty selects an in-memory database.
    std::string databasePath;

    /// @brief Side-effect database file; empty places it in a temporary
    ///        directory owned by the context.
    std::string sysDatabasePath;

    /// @brief Name of the side-effect table inside the `sys` database.
    std::string sideEffectTable{"sys_Write"};
};

/// @brief SQL that attaches @p sysDatabasePath as `sys` and recreates the
///        side-effect table in it.
std::string sysSetupScript(const std::string &sysDatabasePath, const std::string &table);

class ExecContext
{
  public:
    static reltpl::support::Expected<std::unique_ptr<ExecContext>> create(
        const ExecContextOptions &options);

    ExecContext(const ExecContext &) = delete;
    ExecContext &operator=(const ExecContext &) = delete;
    ~ExecContext();

    Database &database()
    {
        return db_;
    }

    const std::filesystem::path &sysDatabasePath() const
    {
        return sysPath_;
    }

    const std::string &sideEffectTable() const
    {
        return table_;
    }

  private:
    ExecContext(Database db, std::filesystem::path tempDir, std::filesystem::path sysPath,
                std::string table);

    Database db_;
    std::filesystem::path tempDir_;
    std::filesystem::path sysPath_;
    std::string table_;
};

} // namespace reltpl::exec
