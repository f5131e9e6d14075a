//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/ExecContext.cpp
// Purpose: Sets up the connection and side-effect table for a render.
//
//===----------------------------------------------------------------------===//

#include "exec/ExecContext.hpp"

#include "codegen/sql/SqlQuote.hpp"
#include "support/diag_codes.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdlib.h>
#include <vector>

namespace reltpl::exec
{

using reltpl::support::Expected;
using reltpl::support::makeError;
namespace fs = std::filesystem;

namespace
{

Expected<fs::path> makeTempDir()
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec)
        return makeError({}, "no temporary directory: " + ec.message(),
                         reltpl::diag::ContextSetupFailed);

    std::string pattern = (base / "reltplXXXXXX").string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data()))
    {
        return makeError({}, "cannot create temporary directory: " +
                                 std::string(std::strerror(errno)),
                         reltpl::diag::ContextSetupFailed);
    }
    return fs::path(buf.data());
}

} // namespace

std::string sysSetupScript(const std::string &sysDatabasePath, const std::string &table)
{
    using reltpl::codegen::sql::quoteIdentifier;
    using reltpl::codegen::sql::quoteLiteral;

    const std::string name = "sys." + quoteIdentifier(table);
    std::string script;
    script += "ATTACH DATABASE " + quoteLiteral(sysDatabasePath) + " AS sys;\n";
    script += "DROP TABLE IF EXISTS " + name + ";\n";
    script += "CREATE TABLE " + name + " ( path UNIQUE, content );\n";
    return script;
}

Expected<std::unique_ptr<ExecContext>> ExecContext::create(const ExecContextOptions &options)
{
    fs::path tempDir;
    fs::path sysPath;
    if (options.sysDatabasePath.empty())
    {
        auto dir = makeTempDir();
        if (!dir)
            return dir.error();
        tempDir = dir.value();
        sysPath = tempDir / "sys.db";
    }
    else
    {
        sysPath = options.sysDatabasePath;
    }

    auto db = Database::open(options.databasePath);
    if (!db)
    {
        std::error_code ec;
        if (!tempDir.empty())
            fs::remove_all(tempDir, ec);
        return makeError({}, db.error().message, reltpl::diag::ContextSetupFailed);
    }

    // Ownership of the temporary directory passes to the context from here.
    std::unique_ptr<ExecContext> ctx(new ExecContext(
        std::move(db.value()), std::move(tempDir), sysPath, options.sideEffectTable));

    auto setup = ctx->db_.exec(sysSetupScript(sysPath.string(), options.sideEffectTable));
    if (!setup)
    {
        return makeError({}, "cannot prepare side-effect table: " + setup.error().message,
                         reltpl::diag::ContextSetupFailed);
    }
    return Expected<std::unique_ptr<ExecContext>>(std::move(ctx));
}

ExecContext::ExecContext(Database db, fs::path tempDir, fs::path sysPath, std::string table)
    : db_(std::move(db)), tempDir_(std::move(tempDir)), sysPath_(std::move(sysPath)),
      table_(std::move(table))
{
}

ExecContext::~ExecContext()
{
    // Close the connection before its files are removed.
    db_.close();
    if (tempDir_.empty())
        return;

    std::error_code ec;
    fs::remove_all(tempDir_, ec);
    if (ec)
        std::cerr << "warning: cannot remove " << tempDir_.string() << ": " << ec.message()
                  << "\n";
}

} // namespace reltpl::exec
