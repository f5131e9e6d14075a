//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/reltpl/cli.hpp
// Purpose: Command-line parsing and driver for the reltpl tool.
// Key invariants: runTool returns 0 on success and 1 on any error.
// Ownership/Lifetime: Output streams are borrowed for the duration of a call.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>
#include <string>

namespace reltpl::tools
{

/// @brief What the tool does with a compiled template.
enum class CliMode
{
    Render,     ///< Execute and print the rendered output (default).
    EmitSql,    ///< Print the generated query only.
    EmitScript, ///< Print the full SQL script a render would run.
};

struct CliOptions
{
    std::string sourcePath;
    CliMode mode = CliMode::Render;
    bool dumpAst = false;
    bool quiet = false;
    bool runFiniOnError = true;
    std::string databasePath;
    std::string sysDatabasePath;
    std::string prefix;
};

/// @brief Outcome of argument parsing.
enum class CliParseResult
{
    Ok,      ///< Options are complete; run the tool.
    Help,    ///< -h/--help was given.
    Version, ///< --version was given.
    Error    ///< Arguments were malformed; a message was written to err.
};

/// @brief Parse @p argv (program name first) into @p opts.
CliParseResult parseArgs(int argc, char **argv, CliOptions &opts, std::ostream &err);

/// @brief Compile and, unless an emit mode is selected, execute a template.
/// @details Results go to @p out; diagnostics, the AST dump and progress
///          messages go to @p err.
int runTool(const CliOptions &opts, std::ostream &out, std::ostream &err);

} // namespace reltpl::tools
