//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST.hpp
/// @brief Abstract syntax tree for template bodies.
///
/// The node set is closed: every node carries a NodeKind tag and consumers
/// dispatch with a switch over the tag followed by a static_cast, so adding
/// a kind is caught by -Wswitch in every walker.
///
/// | Kind | Produced by |
/// |------|-------------|
/// | Text | literal runs, `{{ 'x' }}` |
/// | FieldRef | `{{ col }}`, `{{ Src.col }}`, `{{ $Alias.col }}` |
/// | ParamRef | `{{ @name }}` inside a macro body |
/// | SqlExpr | numbers and any other `{{ expr }}` |
/// | Loop | `{% FROM ... %} ... {% END %}` |
/// | Write | `{% WRITE ... %} ... {% END %}` |
/// | MacroDef | `{% macro name(@a) %} ... {% endmacro %}` |
/// | MacroCall | `{{ call name(args) }}` |
/// | Sequence | bodies and the root |
///
/// Ownership/Lifetime: nodes are owned by their parent via unique_ptr; the
/// root Sequence owns the whole tree and frees it iteratively. The tree is not mutated after parsing
/// except for MacroTable hoisting MacroDef nodes out of the root.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace reltpl::frontends::tpl
{

using SourceLoc = reltpl::support::SourceLoc;

enum class NodeKind
{
    Text,
    FieldRef,
    ParamRef,
    SqlExpr,
    Loop,
    Write,
    MacroDef,
    MacroCall,
    Sequence,
};

/// @brief Ordering direction of a loop.
enum class SortDirection
{
    Ascending,
    Descending,
};

/// @brief Base class of all AST nodes.
struct Node
{
    NodeKind kind;
    SourceLoc loc;

    Node(NodeKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~Node() = default;
};

using NodePtr = std::unique_ptr<Node>;

/// @brief Piece of raw SQL text embedded in a template.
/// @details Raw SQL (WHERE clauses, sub-query sources, free-form escapes and
/// WRITE paths) is kept verbatim except for row and parameter references,
/// which the generator rewrites in the scope where the SQL is emitted.
struct SqlFragment
{
    enum class Kind
    {
        Raw,      ///< Verbatim SQL text.
        RowField, ///< `Src.col` or `$Src.col`.
        Param,    ///< `@name`.
    };

    Kind kind = Kind::Raw;

    /// @brief Raw: the SQL text. RowField/Param: the original spelling, used
    /// verbatim when a lenient RowField names no row in scope.
    std::string text;

    /// @brief RowField: source name without `$`. Param: parameter name without `@`.
    std::string name;

    /// @brief RowField: column name.
    std::string column;

    /// @brief RowField written with `$`; it must resolve to a row in scope.
    bool strict = false;
};

using SqlFragments = std::vector<SqlFragment>;

/// @brief Literal text, emitted as an escaped string literal.
struct TextNode : Node
{
    std::string text;

    TextNode(SourceLoc l, std::string t) : Node(NodeKind::Text, l), text(std::move(t)) {}
};

/// @brief Column of a row in scope.
/// @details An empty @ref source selects the innermost loop.
struct FieldRefNode : Node
{
    std::string source;
    std::string column;

    FieldRefNode(SourceLoc l, std::string s, std::string c)
        : Node(NodeKind::FieldRef, l), source(std::move(s)), column(std::move(c))
    {
    }
};

/// @brief Occurrence of a macro parameter.
struct ParamRefNode : Node
{
    /// @brief Parameter name without the leading `@`.
    std::string name;

    ParamRefNode(SourceLoc l, std::string n) : Node(NodeKind::ParamRef, l), name(std::move(n)) {}
};

/// @brief Free-form SQL expression in an inline escape.
struct SqlExprNode : Node
{
    SqlFragments fragments;

    SqlExprNode(SourceLoc l, SqlFragments f) : Node(NodeKind::SqlExpr, l), fragments(std::move(f))
    {
    }
};

/// @brief Ordered concatenation of child nodes.
/// @details Destruction releases nested bodies from a work list, so tearing
/// down an arbitrarily deep tree does not recurse.
struct SequenceNode : Node
{
    std::vector<NodePtr> children;

    explicit SequenceNode(SourceLoc l) : Node(NodeKind::Sequence, l) {}

    ~SequenceNode() override;
};

using SequencePtr = std::unique_ptr<SequenceNode>;

/// @brief Row source shared by loops and side-effect writes.
struct RowSource
{
    /// @brief Table name, possibly schema-qualified (`sys.sys_Write`).
    /// Empty when @ref subquery is used.
    std::string table;

    /// @brief Parenthesised sub-query source, without the parentheses.
    std::optional<SqlFragments> subquery;

    /// @brief Name FieldRefs use to select this row: the alias without `$`,
    /// or the unqualified table name.
    std::string name;

    /// @brief Optional filter condition.
    SqlFragments where;

    /// @brief Column to order by; rows keep engine order when absent.
    std::optional<std::string> orderBy;

    SortDirection direction = SortDirection::Ascending;

    SourceLoc loc;
};

/// @brief Iteration over the rows of a table or sub-query.
struct LoopNode : Node
{
    RowSource source;

    /// @brief String placed between rendered rows.
    std::string separator;

    SequencePtr body;

    explicit LoopNode(SourceLoc l) : Node(NodeKind::Loop, l) {}
};

/// @brief Side-effect file declaration, rendered as an insert into sys_Write.
struct WriteNode : Node
{
    /// @brief SQL expression producing the output path.
    SqlFragments path;

    /// @brief Optional row source producing one file per row.
    std::optional<RowSource> source;

    SequencePtr body;

    explicit WriteNode(SourceLoc l) : Node(NodeKind::Write, l) {}
};

/// @brief Named, parameterised template fragment.
struct MacroDefNode : Node
{
    std::string name;

    /// @brief Parameter names without the leading `@`, in declaration order.
    std::vector<std::string> params;

    SequencePtr body;

    explicit MacroDefNode(SourceLoc l) : Node(NodeKind::MacroDef, l) {}
};

/// @brief Invocation of a macro with positional arguments.
/// @details Arguments are Text, FieldRef, ParamRef or SqlExpr nodes.
struct MacroCallNode : Node
{
    std::string name;
    std::vector<NodePtr> args;

    explicit MacroCallNode(SourceLoc l) : Node(NodeKind::MacroCall, l) {}
};

/// @brief Name of a node kind for diagnostics and AST dumps.
const char *nodeKindToString(NodeKind kind);

} // namespace reltpl::frontends::tpl
