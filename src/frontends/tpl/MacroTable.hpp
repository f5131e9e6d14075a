//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/tpl/MacroTable.hpp
// Purpose: Collects macro definitions and validates every macro reference.
// Key invariants: Names are unique; the call graph among macros is acyclic;
//                 every call has as many arguments as the callee has
//                 parameters; the table is immutable once built.
// Ownership/Lifetime: The table owns the hoisted MacroDef nodes.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/tpl/AST.hpp"
#include "support/diagnostics.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace reltpl::frontends::tpl
{

class MacroTable
{
  public:
    /// @brief Move every top-level MacroDef out of @p root and validate the
    ///        template's macro usage.
    ///
    /// @details Reports the first problem found and returns std::nullopt:
    /// redefinition, duplicate parameter, call to an unknown macro, argument
    /// count mismatch, unknown `@param`, or a recursion cycle (named as
    /// `a -> b -> a`). On success @p root no longer contains MacroDef nodes and
    /// text runs that were separated by a definition are merged.
    static std::optional<MacroTable> build(SequenceNode &root,
                                           reltpl::support::DiagnosticEngine &diag);

    /// @brief Look up a macro by name; nullptr when undefined.
    const MacroDefNode *find(std::string_view name) const;

    size_t size() const
    {
        return defs_.size();
    }

    /// @brief Definitions in source order.
    const std::vector<std::unique_ptr<MacroDefNode>> &definitions() const
    {
        return defs_;
    }

  private:
    std::vector<std::unique_ptr<MacroDefNode>> defs_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace reltpl::frontends::tpl
