//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the reltpl command-line tool.
//
//===----------------------------------------------------------------------===//

#include "tools/reltpl/cli.hpp"
#include "tools/reltpl/usage.hpp"

#include <iostream>

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        reltpl::tools::printUsage();
        return 1;
    }

    reltpl::tools::CliOptions opts;
    switch (reltpl::tools::parseArgs(argc, argv, opts, std::cerr))
    {
        case reltpl::tools::CliParseResult::Help:
            reltpl::tools::printUsage();
            return 0;
        case reltpl::tools::CliParseResult::Version:
            reltpl::tools::printVersion();
            return 0;
        case reltpl::tools::CliParseResult::Error:
            std::cerr << "\n";
            reltpl::tools::printUsage();
            return 1;
        case reltpl::tools::CliParseResult::Ok:
            break;
    }

    return reltpl::tools::runTool(opts, std::cout, std::cerr);
}
