//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/tpl/AstPrinter.hpp
// Purpose: Human-readable dump of a template AST for --dump-ast.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/tpl/AST.hpp"
#include <string>

namespace reltpl::frontends::tpl
{

class AstPrinter
{
  public:
    /// @brief Dump the tree rooted at @p root, one node per line.
    std::string dump(const SequenceNode &root);
};

} // namespace reltpl::frontends::tpl
