//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file SqlGenerator.hpp
/// @brief Lowers a template AST to one nested SQLite query.
///
/// ## Generated shapes
///
/// | Node | SQL |
/// |------|-----|
/// | Text | `'...'` (in a printf format: `%` doubled) |
/// | FieldRef | `_<depth>_<Row>."col"` |
/// | Sequence | `printf('fmt', args...)` |
/// | Loop | `(SELECT coalesce(group_concat(_pp, sep), '') FROM (SELECT body AS _pp FROM t AS _<depth>_<Row> ...))` |
/// | MacroCall | the macro body, generated inline with arguments bound |
/// | Write | nothing in place; an `INSERT INTO sys_Write` statement |
///
/// Loops are correlated sub-selects: the inner projection may reference any
/// enclosing row alias. Aliases carry the nesting depth, so two loops over the
/// same table at different depths never shadow each other.
///
/// ## Limits
///
/// Nesting of loops and macro expansions is bounded by
/// GeneratorOptions::maxNestingDepth; beyond it generation stops with a
/// diagnostic rather than recursing further. printf() calls are split so no
/// call receives more than GeneratorOptions::maxFunctionArgs arguments.
///
/// @invariant The AST is only read; generation is deterministic.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/sql/CompiledQuery.hpp"
#include "frontends/tpl/AST.hpp"
#include "frontends/tpl/MacroTable.hpp"
#include "frontends/tpl/Schema.hpp"
#include "support/diagnostics.hpp"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace reltpl::codegen::sql
{

struct GeneratorOptions
{
    /// @brief Deepest nesting of loops and macro expansions accepted.
    unsigned maxNestingDepth = 1000;

    /// @brief Largest argument count passed to one printf() call.
    unsigned maxFunctionArgs = 100;

    /// @brief Reject loops over tables the schema catalog does not know.
    bool requireDeclaredTables = false;

    /// @brief Table receiving side-effect rows.
    std::string sideEffectTable = "sys_Write";
};

class SqlGenerator
{
  public:
    SqlGenerator(const reltpl::frontends::tpl::MacroTable &macros,
                 const reltpl::frontends::tpl::Schema &schema,
                 reltpl::support::DiagnosticEngine &diag,
                 GeneratorOptions options = {});

    /// @brief Generate the query for a root sequence with macros hoisted.
    /// @return The compiled query, or std::nullopt after the first error.
    std::optional<CompiledQuery> generate(const reltpl::frontends::tpl::SequenceNode &root);

  private:
    using Node = reltpl::frontends::tpl::Node;
    using SourceLoc = reltpl::frontends::tpl::SourceLoc;

    /// @brief Row visible to field references.
    struct RowScope
    {
        std::string name;
        std::string alias;
        std::string table;
    };

    /// @brief Piece of a printf() call: literal format text or an argument.
    struct FormatPart
    {
        bool isArg;
        std::string text;
    };

    /// @brief Undoes a successful enterNesting() on scope exit.
    struct DepthGuard
    {
        unsigned &depth;

        ~DepthGuard()
        {
            --depth;
        }
    };

    void error(SourceLoc loc, std::string_view code, const std::string &message);
    bool enterNesting(SourceLoc loc);
    std::string pad(unsigned indent) const;

    std::optional<std::string> genSequence(const reltpl::frontends::tpl::SequenceNode &seq,
                                           unsigned indent);
    bool collectParts(const reltpl::frontends::tpl::SequenceNode &seq,
                      unsigned indent,
                      std::vector<FormatPart> &parts);
    std::string emitPrintf(std::vector<FormatPart> parts, unsigned indent) const;

    std::optional<std::string> genValue(const Node &node);
    std::optional<std::string> genFieldRef(const reltpl::frontends::tpl::FieldRefNode &ref);
    std::optional<std::string> genParam(std::string_view name, SourceLoc loc);
    std::optional<std::string> genSql(const reltpl::frontends::tpl::SqlFragments &frags,
                                      SourceLoc loc);
    const RowScope *findScope(std::string_view name) const;

    std::optional<std::string> genLoop(const reltpl::frontends::tpl::LoopNode &loop,
                                       unsigned indent);
    bool genWrite(const reltpl::frontends::tpl::WriteNode &write);
    bool genMacroCall(const reltpl::frontends::tpl::MacroCallNode &call,
                      unsigned indent,
                      std::vector<FormatPart> &parts);

    /// @brief Push the row scope for @p src and emit its FROM/WHERE/ORDER BY
    ///        lines. The caller pops the scope.
    std::optional<std::string> openRowSource(const reltpl::frontends::tpl::RowSource &src,
                                             unsigned indent);

    const reltpl::frontends::tpl::MacroTable &macros_;
    const reltpl::frontends::tpl::Schema &schema_;
    reltpl::support::DiagnosticEngine &diag_;
    GeneratorOptions options_;

    std::vector<RowScope> scopes_;
    std::vector<std::unordered_map<std::string, std::string>> bindings_;
    std::vector<std::string> sideEffects_;
    std::set<std::string> tables_;
    unsigned nesting_ = 0;
    bool hasError_ = false;
};

} // namespace reltpl::codegen::sql
