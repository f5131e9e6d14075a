//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/reltpl/usage.cpp
// Purpose: Help and version text for the reltpl tool.
//
//===----------------------------------------------------------------------===//

#include "tools/reltpl/usage.hpp"

#include "reltpl/version.hpp"

#include <iostream>

namespace reltpl::tools
{

void printVersion()
{
    std::cout << "reltpl v" << RELTPL_VERSION_STR << "\n";
    std::cout << "Relational template compiler\n";
}

void printUsage()
{
    std::cerr << "reltpl v" << RELTPL_VERSION_STR << " - Relational template compiler\n"
              << "\n"
              << "Usage: reltpl [options] <template>\n"
              << "\n"
              << "Usage Modes:\n"
              << "  reltpl page.tpl                 Render to stdout (default)\n"
              << "  reltpl page.tpl --emit-sql      Print the generated query\n"
              << "  reltpl page.tpl --emit-script   Print the full SQL script\n"
              << "\n"
              << "Options:\n"
              << "  --dump-ast          Print the parsed template to stderr\n"
              << "  --db FILE           Main database (default: in-memory)\n"
              << "  --sys-db FILE       Database holding sys_Write (default: temporary)\n"
              << "  --prefix DIR        Write sys_Write files under DIR\n"
              << "  --no-fini-on-error  Skip the fini section when the body fails\n"
              << "  -q                  Suppress progress messages\n"
              << "  -h, --help          Show this help\n"
              << "  --version           Show version information\n"
              << "\n"
              << "Examples:\n"
              << "  reltpl graph.tpl | dot -Tpng > graph.png\n"
              << "  reltpl site.tpl --prefix out/\n"
              << "  reltpl report.tpl --db data.sqlite --emit-sql\n";
}

} // namespace reltpl::tools
