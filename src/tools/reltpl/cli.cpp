//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/reltpl/cli.cpp
// Purpose: Argument parsing and the compile/execute driver of reltpl.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the reltpl command line.
/// @details The driver loads the template, compiles it, and then either
///          prints generated SQL or executes it through the harness and
///          writes side-effect files.

#include "tools/reltpl/cli.hpp"

#include "exec/ExecContext.hpp"
#include "exec/Harness.hpp"
#include "exec/SideEffects.hpp"
#include "frontends/tpl/Compiler.hpp"
#include "support/diag_expected.hpp"
#include "tools/common/source_loader.hpp"

#include <string_view>

namespace reltpl::tools
{

namespace
{

/// @brief Consume the value of option @p arg into @p dest.
bool takeValue(int &i, int argc, char **argv, std::string_view arg, std::string &dest,
               std::ostream &err)
{
    if (i + 1 >= argc)
    {
        err << "error: " << arg << " requires an argument\n";
        return false;
    }
    dest = argv[++i];
    return true;
}

/// @brief Print @p diag attributed to the template file.
void printForFile(reltpl::support::Diag diag, uint32_t fileId,
                  const reltpl::support::SourceManager &sm, std::ostream &err)
{
    if (diag.loc.file_id == 0)
        diag.loc.file_id = fileId;
    reltpl::support::printDiag(diag, err, &sm);
}

} // namespace

CliParseResult parseArgs(int argc, char **argv, CliOptions &opts, std::ostream &err)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help")
            return CliParseResult::Help;
        if (arg == "--version")
            return CliParseResult::Version;

        if (arg == "--emit-sql")
        {
            opts.mode = CliMode::EmitSql;
        }
        else if (arg == "--emit-script")
        {
            opts.mode = CliMode::EmitScript;
        }
        else if (arg == "--dump-ast")
        {
            opts.dumpAst = true;
        }
        else if (arg == "-q")
        {
            opts.quiet = true;
        }
        else if (arg == "--no-fini-on-error")
        {
            opts.runFiniOnError = false;
        }
        else if (arg == "--db")
        {
            if (!takeValue(i, argc, argv, arg, opts.databasePath, err))
                return CliParseResult::Error;
        }
        else if (arg == "--sys-db")
        {
            if (!takeValue(i, argc, argv, arg, opts.sysDatabasePath, err))
                return CliParseResult::Error;
        }
        else if (arg == "--prefix")
        {
            if (!takeValue(i, argc, argv, arg, opts.prefix, err))
                return CliParseResult::Error;
        }
        else if (arg.size() > 1 && arg.starts_with("-"))
        {
            err << "error: unknown option: " << arg << "\n";
            return CliParseResult::Error;
        }
        else
        {
            if (!opts.sourcePath.empty())
            {
                err << "error: multiple templates not supported\n";
                return CliParseResult::Error;
            }
            opts.sourcePath = std::string(arg);
        }
    }

    if (opts.sourcePath.empty())
    {
        err << "error: no template specified\n";
        return CliParseResult::Error;
    }
    return CliParseResult::Ok;
}

int runTool(const CliOptions &opts, std::ostream &out, std::ostream &err)
{
    using namespace reltpl::frontends::tpl;

    reltpl::support::SourceManager sm;
    auto loaded = common::loadSourceBuffer(opts.sourcePath, sm);
    if (!loaded)
    {
        reltpl::support::printDiag(loaded.error(), err, &sm);
        return 1;
    }

    CompilerOptions copts;
    copts.dumpAst = opts.dumpAst;
    // A supplied database may already hold the tables the template reads.
    copts.requireDeclaredTables = opts.databasePath.empty();

    CompilerInput input;
    input.source = loaded.value().buffer;
    input.path = opts.sourcePath;
    input.fileId = loaded.value().fileId;

    CompilerResult result = compile(input, copts, sm);
    result.diagnostics.printAll(err, &sm);
    if (!result.succeeded())
        return 1;

    const std::string initScript = result.sections.initScript();
    const std::string finiScript = result.sections.finiScript();

    if (opts.mode == CliMode::EmitSql)
    {
        out << result.query.text << ";\n";
        return 0;
    }

    reltpl::exec::ExecContextOptions ctxOpts;
    ctxOpts.databasePath = opts.databasePath;
    ctxOpts.sysDatabasePath = opts.sysDatabasePath;

    if (opts.mode == CliMode::EmitScript)
    {
        const std::string sysPath =
            opts.sysDatabasePath.empty() ? std::string("sys.db") : opts.sysDatabasePath;
        out << reltpl::exec::buildScript(
            sysPath, ctxOpts.sideEffectTable, result.query, initScript, finiScript);
        return 0;
    }

    auto ctx = reltpl::exec::ExecContext::create(ctxOpts);
    if (!ctx)
    {
        printForFile(ctx.error(), result.fileId, sm, err);
        return 1;
    }

    reltpl::exec::HarnessOptions hopts;
    hopts.runFiniOnBodyFailure = opts.runFiniOnError;
    auto rendered =
        reltpl::exec::render(*ctx.value(), result.query, initScript, finiScript, hopts);
    if (!rendered)
    {
        printForFile(rendered.error(), result.fileId, sm, err);
        return 1;
    }

    out << rendered.value().output << "\n";
    out.flush();

    auto written =
        reltpl::exec::materialize(rendered.value().sideEffects, opts.prefix, opts.quiet, err);
    if (!written)
    {
        printForFile(written.error(), result.fileId, sm, err);
        return 1;
    }
    return 0;
}

} // namespace reltpl::tools
