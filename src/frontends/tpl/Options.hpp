//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/tpl/Options.hpp
// Purpose: Options controlling one template compilation.
//
//===----------------------------------------------------------------------===//

#pragma once

namespace reltpl::frontends::tpl
{

struct CompilerOptions
{
    /// @brief Print the parsed AST to stderr before macro resolution.
    bool dumpAst{false};

    /// @brief Reject loops over tables the init section does not create.
    bool requireDeclaredTables{false};

    /// @brief Deepest nesting of loops and macro expansions accepted.
    unsigned maxNestingDepth{1000};

    /// @brief Largest argument count of one generated printf() call.
    unsigned maxFunctionArgs{100};
};

} // namespace reltpl::frontends::tpl
