//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/sql/SqlGenerator.cpp
// Purpose: Sequence, value and macro lowering for the SQL generator.
// Key invariants: Macro arguments are generated in the caller's scope before
//                 the callee's parameter frame is pushed.
//
//===----------------------------------------------------------------------===//

#include "codegen/sql/SqlGenerator.hpp"

#include "codegen/sql/SqlQuote.hpp"
#include "support/diag_codes.hpp"

#include <algorithm>
#include <cctype>

namespace reltpl::codegen::sql
{

using namespace reltpl::frontends::tpl;

namespace
{

bool equalsIgnoreCase(std::string_view a, std::string_view b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

SqlGenerator::SqlGenerator(const MacroTable &macros,
                           const Schema &schema,
                           reltpl::support::DiagnosticEngine &diag,
                           GeneratorOptions options)
    : macros_(macros), schema_(schema), diag_(diag), options_(std::move(options))
{
}

void SqlGenerator::error(SourceLoc loc, std::string_view code, const std::string &message)
{
    hasError_ = true;
    diag_.error(loc, code, message);
}

bool SqlGenerator::enterNesting(SourceLoc loc)
{
    if (++nesting_ > options_.maxNestingDepth)
    {
        --nesting_;
        error(loc,
              reltpl::diag::NestingTooDeep,
              "loops and macro expansions nested too deeply (limit: " +
                  std::to_string(options_.maxNestingDepth) + ")");
        return false;
    }
    return true;
}

std::string SqlGenerator::pad(unsigned indent) const
{
    return std::string(static_cast<size_t>(indent) * 2, ' ');
}

std::optional<CompiledQuery> SqlGenerator::generate(const SequenceNode &root)
{
    scopes_.clear();
    bindings_.clear();
    sideEffects_.clear();
    tables_.clear();
    nesting_ = 0;
    hasError_ = false;

    auto expr = genSequence(root, 0);
    if (!expr || hasError_)
        return std::nullopt;

    CompiledQuery query;
    query.text = "SELECT " + *expr + " AS _pp";
    query.tables = std::move(tables_);
    query.sideEffects = std::move(sideEffects_);
    return query;
}

//===----------------------------------------------------------------------===//
// Sequences
//===----------------------------------------------------------------------===//

std::optional<std::string> SqlGenerator::genSequence(const SequenceNode &seq, unsigned indent)
{
    std::vector<FormatPart> parts;
    if (!collectParts(seq, indent, parts))
        return std::nullopt;
    return emitPrintf(std::move(parts), indent);
}

bool SqlGenerator::collectParts(const SequenceNode &seq,
                                unsigned indent,
                                std::vector<FormatPart> &parts)
{
    for (const auto &child : seq.children)
    {
        switch (child->kind)
        {
            case NodeKind::Text:
            {
                const auto &text = static_cast<const TextNode &>(*child).text;
                if (text.find('\0') != std::string::npos)
                {
                    error(child->loc,
                          reltpl::diag::UnsupportedLiteral,
                          "text contains a NUL byte, which SQLite string literals cannot hold");
                    return false;
                }
                parts.push_back({false, text});
                break;
            }
            case NodeKind::FieldRef:
            case NodeKind::ParamRef:
            case NodeKind::SqlExpr:
            {
                auto value = genValue(*child);
                if (!value)
                    return false;
                parts.push_back({true, std::move(*value)});
                break;
            }
            case NodeKind::Loop:
            {
                auto loop = genLoop(static_cast<const LoopNode &>(*child), indent + 1);
                if (!loop)
                    return false;
                parts.push_back({true, std::move(*loop)});
                break;
            }
            case NodeKind::Write:
                if (!genWrite(static_cast<const WriteNode &>(*child)))
                    return false;
                break;
            case NodeKind::MacroCall:
                if (!genMacroCall(static_cast<const MacroCallNode &>(*child), indent, parts))
                    return false;
                break;
            case NodeKind::Sequence:
                if (!collectParts(static_cast<const SequenceNode &>(*child), indent, parts))
                    return false;
                break;
            case NodeKind::MacroDef:
                // Definitions produce no output where they are written.
                break;
        }
    }
    return true;
}

std::string SqlGenerator::emitPrintf(std::vector<FormatPart> parts, unsigned indent) const
{
    const size_t limit = std::max<size_t>(options_.maxFunctionArgs, 3);

    std::vector<FormatPart> merged;
    size_t args = 0;
    for (auto &part : parts)
    {
        if (!part.isArg && !merged.empty() && !merged.back().isArg)
        {
            merged.back().text += part.text;
            continue;
        }
        args += part.isArg ? 1 : 0;
        merged.push_back(std::move(part));
    }

    if (args == 0)
        return quoteLiteral(merged.empty() ? std::string() : merged.front().text);

    // The format string occupies one argument slot.
    if (args + 1 > limit)
    {
        std::vector<FormatPart> grouped;
        std::vector<FormatPart> chunk;
        size_t chunkArgs = 0;
        for (auto &part : merged)
        {
            if (part.isArg && chunkArgs + 1 >= limit)
            {
                grouped.push_back({true, emitPrintf(std::move(chunk), indent + 1)});
                chunk.clear();
                chunkArgs = 0;
            }
            chunkArgs += part.isArg ? 1 : 0;
            chunk.push_back(std::move(part));
        }
        if (!chunk.empty())
            grouped.push_back({true, emitPrintf(std::move(chunk), indent + 1)});
        return emitPrintf(std::move(grouped), indent);
    }

    std::string format;
    for (const auto &part : merged)
        format += part.isArg ? std::string("%s") : escapeFormat(part.text);

    std::string out = "printf(" + quoteLiteral(format);
    for (const auto &part : merged)
    {
        if (part.isArg)
            out += "\n" + pad(indent + 1) + ", " + part.text;
    }
    out += ")";
    return out;
}

//===----------------------------------------------------------------------===//
// Values
//===----------------------------------------------------------------------===//

std::optional<std::string> SqlGenerator::genValue(const Node &node)
{
    switch (node.kind)
    {
        case NodeKind::Text:
        {
            const auto &text = static_cast<const TextNode &>(node).text;
            if (text.find('\0') != std::string::npos)
            {
                error(node.loc,
                      reltpl::diag::UnsupportedLiteral,
                      "text contains a NUL byte, which SQLite string literals cannot hold");
                return std::nullopt;
            }
            return quoteLiteral(text);
        }
        case NodeKind::FieldRef:
            return genFieldRef(static_cast<const FieldRefNode &>(node));
        case NodeKind::ParamRef:
            return genParam(static_cast<const ParamRefNode &>(node).name, node.loc);
        case NodeKind::SqlExpr:
        {
            auto sql = genSql(static_cast<const SqlExprNode &>(node).fragments, node.loc);
            if (!sql)
                return std::nullopt;
            return "(" + *sql + ")";
        }
        case NodeKind::Loop:
        case NodeKind::Write:
        case NodeKind::MacroDef:
        case NodeKind::MacroCall:
        case NodeKind::Sequence:
            break;
    }
    error(node.loc,
          reltpl::diag::UnsupportedLiteral,
          std::string("'") + nodeKindToString(node.kind) + "' cannot be used as a value");
    return std::nullopt;
}

const SqlGenerator::RowScope *SqlGenerator::findScope(std::string_view name) const
{
    for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it)
    {
        if (equalsIgnoreCase(it->name, name))
            return &*it;
    }
    return nullptr;
}

std::optional<std::string> SqlGenerator::genFieldRef(const FieldRefNode &ref)
{
    const RowScope *scope = nullptr;
    if (ref.source.empty())
    {
        if (scopes_.empty())
        {
            error(ref.loc,
                  reltpl::diag::FieldOutsideLoop,
                  "field reference '" + ref.column + "' outside of any loop");
            return std::nullopt;
        }
        scope = &scopes_.back();
    }
    else
    {
        scope = findScope(ref.source);
        if (!scope)
        {
            error(ref.loc,
                  reltpl::diag::UnknownRowSource,
                  "no row named '" + ref.source + "' in scope for '" + ref.source + "." +
                      ref.column + "'");
            return std::nullopt;
        }
    }

    if (!scope->table.empty() && !schema_.mayHaveColumn(scope->table, ref.column))
    {
        error(ref.loc,
              reltpl::diag::UnknownColumn,
              "table '" + scope->table + "' has no column '" + ref.column + "'");
        return std::nullopt;
    }
    return scope->alias + "." + quoteIdentifier(ref.column);
}

std::optional<std::string> SqlGenerator::genParam(std::string_view name, SourceLoc loc)
{
    if (!bindings_.empty())
    {
        auto it = bindings_.back().find(std::string(name));
        if (it != bindings_.back().end())
            return it->second;
    }
    error(loc,
          reltpl::diag::UnknownParameter,
          "parameter '@" + std::string(name) + "' is not bound here");
    return std::nullopt;
}

std::optional<std::string> SqlGenerator::genSql(const SqlFragments &frags, SourceLoc loc)
{
    std::string out;
    for (const auto &frag : frags)
    {
        switch (frag.kind)
        {
            case SqlFragment::Kind::Raw:
                out += frag.text;
                break;
            case SqlFragment::Kind::Param:
            {
                auto value = genParam(frag.name, loc);
                if (!value)
                    return std::nullopt;
                out += "(" + *value + ")";
                break;
            }
            case SqlFragment::Kind::RowField:
            {
                const RowScope *scope = findScope(frag.name);
                if (scope)
                {
                    out += scope->alias + "." + quoteIdentifier(frag.column);
                    break;
                }
                if (frag.strict)
                {
                    error(loc,
                          reltpl::diag::UnknownRowSource,
                          "no row named '" + frag.name + "' in scope for '" + frag.text + "'");
                    return std::nullopt;
                }
                out += frag.text;
                break;
            }
        }
    }
    return out;
}

//===----------------------------------------------------------------------===//
// Macros
//===----------------------------------------------------------------------===//

bool SqlGenerator::genMacroCall(const MacroCallNode &call,
                                unsigned indent,
                                std::vector<FormatPart> &parts)
{
    const MacroDefNode *def = macros_.find(call.name);
    if (!def)
    {
        error(call.loc,
              reltpl::diag::UnknownMacro,
              "call to undefined macro '" + call.name + "'");
        return false;
    }
    if (def->params.size() != call.args.size())
    {
        error(call.loc,
              reltpl::diag::ArgumentCountMismatch,
              "macro '" + call.name + "' expects " + std::to_string(def->params.size()) +
                  " argument(s), got " + std::to_string(call.args.size()));
        return false;
    }
    if (!enterNesting(call.loc))
        return false;
    DepthGuard guard{nesting_};

    std::unordered_map<std::string, std::string> frame;
    for (size_t i = 0; i < call.args.size(); ++i)
    {
        auto value = genValue(*call.args[i]);
        if (!value)
            return false;
        frame.emplace(def->params[i], std::move(*value));
    }

    bindings_.push_back(std::move(frame));
    const bool ok = collectParts(*def->body, indent, parts);
    bindings_.pop_back();
    return ok;
}

} // namespace reltpl::codegen::sql
