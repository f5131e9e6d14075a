//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "frontends/tpl/AstPrinter.hpp"

#include <sstream>

namespace reltpl::frontends::tpl
{

namespace
{

// ---------------------------------------------------------------------------
// Printer helper -- manages indentation and line output.
// ---------------------------------------------------------------------------

struct Printer
{
    std::ostream &os;
    int indent = 0;

    void line(const std::string &text)
    {
        for (int i = 0; i < indent; ++i)
            os << "  ";
        os << text << '\n';
    }

    void push()
    {
        ++indent;
    }

    void pop()
    {
        --indent;
    }
};

void printNode(const Node &node, Printer &p);

std::string locStr(const SourceLoc &loc)
{
    std::ostringstream s;
    s << "(" << loc.line << ":" << loc.column << ")";
    return s.str();
}

/// @brief Render @p text with control characters escaped, in double quotes.
std::string escaped(const std::string &text)
{
    std::string out = "\"";
    for (char c : text)
    {
        switch (c)
        {
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            default:
                out.push_back(c);
        }
    }
    out.push_back('"');
    return out;
}

std::string sqlStr(const SqlFragments &frags)
{
    std::string out;
    for (const auto &frag : frags)
    {
        switch (frag.kind)
        {
            case SqlFragment::Kind::Raw:
                out += frag.text;
                break;
            case SqlFragment::Kind::RowField:
                out += "<" + frag.name + "." + frag.column + ">";
                break;
            case SqlFragment::Kind::Param:
                out += "<@" + frag.name + ">";
                break;
        }
    }
    return out;
}

std::string sourceStr(const RowSource &src)
{
    std::string out = src.subquery ? "(" + sqlStr(*src.subquery) + ")" : src.table;
    out += " AS " + src.name;
    if (!src.where.empty())
        out += " WHERE " + sqlStr(src.where);
    if (src.orderBy)
    {
        out += " ORDER BY " + *src.orderBy +
               (src.direction == SortDirection::Descending ? " DESC" : " ASC");
    }
    return out;
}

void printBody(const SequenceNode *body, Printer &p)
{
    if (!body)
        return;
    p.push();
    for (const auto &child : body->children)
        printNode(*child, p);
    p.pop();
}

void printNode(const Node &node, Printer &p)
{
    const std::string loc = " " + locStr(node.loc);
    switch (node.kind)
    {
        case NodeKind::Text:
            p.line("Text " + escaped(static_cast<const TextNode &>(node).text) + loc);
            return;
        case NodeKind::FieldRef:
        {
            const auto &ref = static_cast<const FieldRefNode &>(node);
            p.line("FieldRef " + (ref.source.empty() ? std::string("<innermost>") : ref.source) +
                   "." + ref.column + loc);
            return;
        }
        case NodeKind::ParamRef:
            p.line("ParamRef @" + static_cast<const ParamRefNode &>(node).name + loc);
            return;
        case NodeKind::SqlExpr:
            p.line("SqlExpr " + sqlStr(static_cast<const SqlExprNode &>(node).fragments) + loc);
            return;
        case NodeKind::Loop:
        {
            const auto &loop = static_cast<const LoopNode &>(node);
            p.line("Loop " + sourceStr(loop.source) + " SEP " + escaped(loop.separator) + loc);
            printBody(loop.body.get(), p);
            return;
        }
        case NodeKind::Write:
        {
            const auto &write = static_cast<const WriteNode &>(node);
            std::string head = "Write " + sqlStr(write.path);
            if (write.source)
                head += " FROM " + sourceStr(*write.source);
            p.line(head + loc);
            printBody(write.body.get(), p);
            return;
        }
        case NodeKind::MacroDef:
        {
            const auto &def = static_cast<const MacroDefNode &>(node);
            std::string params;
            for (const auto &param : def.params)
                params += (params.empty() ? "@" : ", @") + param;
            p.line("MacroDef " + def.name + "(" + params + ")" + loc);
            printBody(def.body.get(), p);
            return;
        }
        case NodeKind::MacroCall:
        {
            const auto &call = static_cast<const MacroCallNode &>(node);
            p.line("MacroCall " + call.name + loc);
            p.push();
            for (const auto &arg : call.args)
                printNode(*arg, p);
            p.pop();
            return;
        }
        case NodeKind::Sequence:
            p.line("Sequence" + loc);
            printBody(static_cast<const SequenceNode *>(&node), p);
            return;
    }
}

} // namespace

std::string AstPrinter::dump(const SequenceNode &root)
{
    std::ostringstream os;
    Printer p{os};
    printNode(root, p);
    return os.str();
}

} // namespace reltpl::frontends::tpl
