//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "frontends/tpl/AST.hpp"

#include <utility>

namespace reltpl::frontends::tpl
{

namespace
{

/// @brief Body owned by a block node, or null for leaves.
SequenceNode *bodyOf(Node &node)
{
    switch (node.kind)
    {
        case NodeKind::Loop:
            return static_cast<LoopNode &>(node).body.get();
        case NodeKind::Write:
            return static_cast<WriteNode &>(node).body.get();
        case NodeKind::MacroDef:
            return static_cast<MacroDefNode &>(node).body.get();
        case NodeKind::Sequence:
            return static_cast<SequenceNode *>(&node);
        case NodeKind::Text:
        case NodeKind::FieldRef:
        case NodeKind::ParamRef:
        case NodeKind::SqlExpr:
        case NodeKind::MacroCall:
            return nullptr;
    }
    return nullptr;
}

} // namespace

SequenceNode::~SequenceNode()
{
    // Hoist grandchildren into the work list before each node dies; every
    // body is empty by the time its own destructor runs.
    std::vector<NodePtr> pending = std::move(children);
    children.clear();
    while (!pending.empty())
    {
        NodePtr node = std::move(pending.back());
        pending.pop_back();
        if (SequenceNode *body = bodyOf(*node))
        {
            for (auto &child : body->children)
                pending.push_back(std::move(child));
            body->children.clear();
        }
    }
}

const char *nodeKindToString(NodeKind kind)
{
    switch (kind)
    {
        case NodeKind::Text:
            return "Text";
        case NodeKind::FieldRef:
            return "FieldRef";
        case NodeKind::ParamRef:
            return "ParamRef";
        case NodeKind::SqlExpr:
            return "SqlExpr";
        case NodeKind::Loop:
            return "Loop";
        case NodeKind::Write:
            return "Write";
        case NodeKind::MacroDef:
            return "MacroDef";
        case NodeKind::MacroCall:
            return "MacroCall";
        case NodeKind::Sequence:
            return "Sequence";
    }
    return "Unknown";
}

} // namespace reltpl::frontends::tpl
