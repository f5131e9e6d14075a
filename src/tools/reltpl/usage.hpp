//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/reltpl/usage.hpp
// Purpose: Help and version text for the reltpl tool.
//
//===----------------------------------------------------------------------===//

#pragma once

namespace reltpl::tools
{

/// @brief Print usage information to stderr.
void printUsage();

/// @brief Print version information to stdout.
void printVersion();

} // namespace reltpl::tools
