//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/tpl/MacroTable.cpp
// Purpose: Macro hoisting, reference resolution and recursion detection.
// Key invariants: All walks use explicit work lists and never recurse.
//
//===----------------------------------------------------------------------===//

#include "frontends/tpl/MacroTable.hpp"

#include "support/diag_codes.hpp"

#include <functional>
#include <unordered_set>

namespace reltpl::frontends::tpl
{

namespace
{

using reltpl::support::DiagnosticEngine;

/// @brief Visit every node below @p root (excluding root) in source order.
/// @details Macro call arguments are visited as children of the call.
void forEachNode(const SequenceNode &root, const std::function<void(const Node &)> &fn)
{
    std::vector<const Node *> work;
    for (auto it = root.children.rbegin(); it != root.children.rend(); ++it)
        work.push_back(it->get());

    auto pushBody = [&work](const SequenceNode *body) {
        if (!body)
            return;
        for (auto it = body->children.rbegin(); it != body->children.rend(); ++it)
            work.push_back(it->get());
    };

    while (!work.empty())
    {
        const Node *node = work.back();
        work.pop_back();
        fn(*node);
        switch (node->kind)
        {
            case NodeKind::Loop:
                pushBody(static_cast<const LoopNode *>(node)->body.get());
                break;
            case NodeKind::Write:
                pushBody(static_cast<const WriteNode *>(node)->body.get());
                break;
            case NodeKind::MacroDef:
                pushBody(static_cast<const MacroDefNode *>(node)->body.get());
                break;
            case NodeKind::Sequence:
                pushBody(static_cast<const SequenceNode *>(node));
                break;
            case NodeKind::MacroCall:
            {
                const auto &args = static_cast<const MacroCallNode *>(node)->args;
                for (auto it = args.rbegin(); it != args.rend(); ++it)
                    work.push_back(it->get());
                break;
            }
            case NodeKind::Text:
            case NodeKind::FieldRef:
            case NodeKind::ParamRef:
            case NodeKind::SqlExpr:
                break;
        }
    }
}

/// @brief Parameter names referenced by raw SQL carried on @p node.
void collectSqlParams(const Node &node, std::vector<std::string> &out)
{
    auto fromFragments = [&out](const SqlFragments &frags) {
        for (const auto &frag : frags)
        {
            if (frag.kind == SqlFragment::Kind::Param)
                out.push_back(frag.name);
        }
    };
    auto fromSource = [&](const RowSource &src) {
        if (src.subquery)
            fromFragments(*src.subquery);
        fromFragments(src.where);
    };

    switch (node.kind)
    {
        case NodeKind::ParamRef:
            out.push_back(static_cast<const ParamRefNode &>(node).name);
            break;
        case NodeKind::SqlExpr:
            fromFragments(static_cast<const SqlExprNode &>(node).fragments);
            break;
        case NodeKind::Loop:
            fromSource(static_cast<const LoopNode &>(node).source);
            break;
        case NodeKind::Write:
        {
            const auto &write = static_cast<const WriteNode &>(node);
            fromFragments(write.path);
            if (write.source)
                fromSource(*write.source);
            break;
        }
        default:
            break;
    }
}

void mergeAdjacentText(SequenceNode &root)
{
    std::vector<NodePtr> merged;
    for (auto &child : root.children)
    {
        if (child->kind == NodeKind::Text && !merged.empty() &&
            merged.back()->kind == NodeKind::Text)
        {
            static_cast<TextNode &>(*merged.back()).text +=
                static_cast<TextNode &>(*child).text;
            continue;
        }
        merged.push_back(std::move(child));
    }
    root.children = std::move(merged);
}

} // namespace

const MacroDefNode *MacroTable::find(std::string_view name) const
{
    auto it = index_.find(std::string(name));
    return it == index_.end() ? nullptr : defs_[it->second].get();
}

std::optional<MacroTable> MacroTable::build(SequenceNode &root, DiagnosticEngine &diag)
{
    MacroTable table;

    // Hoist definitions out of the root sequence.
    std::vector<NodePtr> kept;
    for (auto &child : root.children)
    {
        if (child->kind != NodeKind::MacroDef)
        {
            kept.push_back(std::move(child));
            continue;
        }
        std::unique_ptr<MacroDefNode> def(static_cast<MacroDefNode *>(child.release()));
        if (const MacroDefNode *prior = table.find(def->name))
        {
            diag.error(def->loc,
                       reltpl::diag::MacroRedefined,
                       "macro '" + def->name + "' redefined (first defined at line " +
                           std::to_string(prior->loc.line) + ")");
            return std::nullopt;
        }
        std::unordered_set<std::string> seen;
        for (const auto &param : def->params)
        {
            if (!seen.insert(param).second)
            {
                diag.error(def->loc,
                           reltpl::diag::DuplicateParameter,
                           "duplicate parameter '@" + param + "' in macro '" + def->name + "'");
                return std::nullopt;
            }
        }
        table.index_.emplace(def->name, table.defs_.size());
        table.defs_.push_back(std::move(def));
    }
    root.children = std::move(kept);
    mergeAdjacentText(root);

    // Resolve calls and parameters. Edges record the call graph for the
    // recursion check below.
    std::vector<std::vector<size_t>> edges(table.defs_.size());
    bool ok = true;

    auto checkBody = [&](const SequenceNode &body, const MacroDefNode *owner, size_t ownerIndex) {
        forEachNode(body, [&](const Node &node) {
            if (!ok)
                return;
            if (node.kind == NodeKind::MacroCall)
            {
                const auto &call = static_cast<const MacroCallNode &>(node);
                auto it = table.index_.find(call.name);
                if (it == table.index_.end())
                {
                    diag.error(call.loc,
                               reltpl::diag::UnknownMacro,
                               "call to undefined macro '" + call.name + "'");
                    ok = false;
                    return;
                }
                const MacroDefNode &callee = *table.defs_[it->second];
                if (call.args.size() != callee.params.size())
                {
                    diag.error(call.loc,
                               reltpl::diag::ArgumentCountMismatch,
                               "macro '" + call.name + "' expects " +
                                   std::to_string(callee.params.size()) + " argument(s), got " +
                                   std::to_string(call.args.size()));
                    ok = false;
                    return;
                }
                if (owner)
                    edges[ownerIndex].push_back(it->second);
                return;
            }

            std::vector<std::string> params;
            collectSqlParams(node, params);
            for (const auto &name : params)
            {
                if (!owner)
                {
                    diag.error(node.loc,
                               reltpl::diag::UnknownParameter,
                               "parameter '@" + name + "' used outside of a macro");
                    ok = false;
                    return;
                }
                bool declared = false;
                for (const auto &param : owner->params)
                    declared = declared || param == name;
                if (!declared)
                {
                    diag.error(node.loc,
                               reltpl::diag::UnknownParameter,
                               "unknown parameter '@" + name + "' in macro '" + owner->name + "'");
                    ok = false;
                    return;
                }
            }
        });
    };

    for (size_t i = 0; i < table.defs_.size() && ok; ++i)
        checkBody(*table.defs_[i]->body, table.defs_[i].get(), i);
    if (ok)
        checkBody(root, nullptr, 0);
    if (!ok)
        return std::nullopt;

    // Depth-first search for a cycle in the call graph, using an explicit
    // stack of (macro, next edge) frames.
    enum class Mark
    {
        Unvisited,
        Active,
        Done
    };
    std::vector<Mark> marks(table.defs_.size(), Mark::Unvisited);
    for (size_t start = 0; start < table.defs_.size(); ++start)
    {
        if (marks[start] != Mark::Unvisited)
            continue;
        std::vector<std::pair<size_t, size_t>> stack{{start, 0}};
        marks[start] = Mark::Active;
        while (!stack.empty())
        {
            auto &[node, edge] = stack.back();
            if (edge == edges[node].size())
            {
                marks[node] = Mark::Done;
                stack.pop_back();
                continue;
            }
            size_t target = edges[node][edge++];
            if (marks[target] == Mark::Active)
            {
                std::string cycle;
                bool inCycle = false;
                for (const auto &frame : stack)
                {
                    inCycle = inCycle || frame.first == target;
                    if (inCycle)
                        cycle += table.defs_[frame.first]->name + " -> ";
                }
                cycle += table.defs_[target]->name;
                diag.error(table.defs_[target]->loc,
                           reltpl::diag::RecursiveMacro,
                           "recursive macro: " + cycle);
                return std::nullopt;
            }
            if (marks[target] == Mark::Unvisited)
            {
                marks[target] = Mark::Active;
                stack.emplace_back(target, 0);
            }
        }
    }

    return table;
}

} // namespace reltpl::frontends::tpl
