//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/tpl/Parser.cpp
// Purpose: Structural parsing of template bodies: nesting of directives,
//          placement rules and whitespace trimming.
// Key invariants: stack_ holds the open constructs innermost-last; the body
//                 receiving new nodes is always current(); loops never nest
//                 deeper than maxNesting_.
// Ownership/Lifetime: Nodes are owned by root_ until returned.
//
//===----------------------------------------------------------------------===//

#include "frontends/tpl/Parser.hpp"

#include "support/diag_codes.hpp"

namespace reltpl::frontends::tpl
{

namespace
{

bool isBlank(char c)
{
    return c == ' ' || c == '\t' || c == '\f' || c == '\v';
}

bool isSpace(char c)
{
    return isBlank(c) || c == '\n' || c == '\r';
}

std::string lineOf(SourceLoc loc)
{
    return std::to_string(loc.line);
}

const char *closerFor(DirectiveKind open)
{
    return open == DirectiveKind::MacroDef ? "endmacro" : "END";
}

} // namespace

void trimLeft(std::string &text, unsigned amount)
{
    if (amount == 0)
        return;
    size_t i = 0;
    if (amount >= 3)
    {
        while (i < text.size() && isSpace(text[i]))
            ++i;
        text.erase(0, i);
        return;
    }
    while (i < text.size() && isBlank(text[i]))
        ++i;
    if (amount == 2 && i < text.size())
    {
        if (text.compare(i, 2, "\r\n") == 0)
            i += 2;
        else if (text[i] == '\n' || text[i] == '\r')
            ++i;
    }
    text.erase(0, i);
}

void trimRight(std::string &text, unsigned amount)
{
    if (amount == 0)
        return;
    size_t end = text.size();
    if (amount >= 3)
    {
        while (end > 0 && isSpace(text[end - 1]))
            --end;
        text.resize(end);
        return;
    }
    while (end > 0 && isBlank(text[end - 1]))
        --end;
    if (amount == 2 && end > 0)
    {
        if (end >= 2 && text.compare(end - 2, 2, "\r\n") == 0)
            end -= 2;
        else if (text[end - 1] == '\n' || text[end - 1] == '\r')
            --end;
    }
    text.resize(end);
}

Parser::Parser(Lexer &lexer, reltpl::support::DiagnosticEngine &diag) : lexer_(lexer), diag_(diag)
{
}

void Parser::error(SourceLoc loc, std::string_view code, const std::string &message)
{
    hasError_ = true;
    diag_.error(loc, code, message);
}

SequenceNode &Parser::current()
{
    return stack_.empty() ? *root_ : *stack_.back().body;
}

void Parser::appendText(std::string text, SourceLoc loc)
{
    if (pendingTrim_)
    {
        trimLeft(text, *pendingTrim_);
        pendingTrim_.reset();
    }
    if (text.empty())
        return;
    auto &children = current().children;
    if (!children.empty() && children.back().get() == templateText_)
    {
        templateText_->text += text;
        return;
    }
    auto node = std::make_unique<TextNode>(loc, std::move(text));
    templateText_ = node.get();
    children.push_back(std::move(node));
}

void Parser::appendNode(NodePtr node)
{
    if (node)
        current().children.push_back(std::move(node));
}

void Parser::trimPrecedingText(unsigned amount)
{
    // Only template text trims; literals from substitutions are kept whole.
    auto &children = current().children;
    if (children.empty() || children.back().get() != templateText_)
        return;
    trimRight(templateText_->text, amount);
    if (templateText_->text.empty())
    {
        templateText_ = nullptr;
        children.pop_back();
    }
}

std::unique_ptr<SequenceNode> Parser::parseTemplate()
{
    root_ = std::make_unique<SequenceNode>(SourceLoc{});
    stack_.clear();
    pendingTrim_.reset();
    templateText_ = nullptr;

    while (!hasError_)
    {
        Token tok = lexer_.next();
        if (tok.is(TokenKind::Literal))
        {
            appendText(std::move(tok.text), tok.loc);
            continue;
        }
        pendingTrim_.reset();

        switch (tok.kind)
        {
            case TokenKind::Eof:
                if (!stack_.empty())
                {
                    const auto &open = stack_.back();
                    error(open.loc,
                          reltpl::diag::UnclosedConstruct,
                          std::string("unclosed '") + directiveKindToString(open.directive) +
                              "' opened at line " + lineOf(open.loc) + " (expected '" +
                              closerFor(open.directive) + "')");
                    return nullptr;
                }
                return std::move(root_);
            case TokenKind::Error:
                hasError_ = true;
                break;
            case TokenKind::Literal:
                break;
            case TokenKind::Substitution:
                appendNode(parseValue(tok.text, tok.loc));
                break;
            case TokenKind::MacroCallMarker:
                appendNode(parseMacroCall(tok.text, tok.loc));
                break;
            case TokenKind::DirectiveOpen:
                handleOpen(tok);
                break;
            case TokenKind::DirectiveClose:
                handleClose(tok);
                break;
        }
    }
    return nullptr;
}

unsigned Parser::openLoopDepth() const
{
    // A macro definition can only sit at the bottom of the stack.
    size_t depth = stack_.size();
    if (!stack_.empty() && stack_.front().directive == DirectiveKind::MacroDef)
        --depth;
    return static_cast<unsigned>(depth);
}

void Parser::handleOpen(Token &tok)
{
    switch (tok.directive)
    {
        case DirectiveKind::Loop:
        {
            if (openLoopDepth() >= maxNesting_)
            {
                error(tok.loc,
                      reltpl::diag::NestingTooDeep,
                      "loops and macro expansions nested too deeply (limit: " +
                          std::to_string(maxNesting_) + ")");
                return;
            }
            auto loop = std::make_unique<LoopNode>(tok.loc);
            auto source = parseRowSource(tok.text, tok.loc, &loop->separator);
            if (!source)
                return;
            loop->source = std::move(*source);
            loop->body = std::make_unique<SequenceNode>(tok.loc);
            trimPrecedingText(tok.trimBefore.value_or(trims_.blockOpenBefore));
            OpenConstruct open{DirectiveKind::Loop, loop.get(), loop->body.get(), tok.loc};
            current().children.push_back(std::move(loop));
            stack_.push_back(open);
            pendingTrim_ = tok.trimAfter.value_or(trims_.blockOpenAfter);
            return;
        }
        case DirectiveKind::Write:
        {
            if (!stack_.empty())
            {
                error(tok.loc,
                      reltpl::diag::WriteNotTopLevel,
                      std::string("'WRITE' is only allowed at the top level (found inside '") +
                          directiveKindToString(stack_.back().directive) + "')");
                return;
            }
            auto write = parseWriteHeader(tok.text, tok.loc);
            if (!write)
                return;
            trimPrecedingText(tok.trimBefore.value_or(trims_.blockOpenBefore));
            OpenConstruct open{DirectiveKind::Write, write.get(), write->body.get(), tok.loc};
            current().children.push_back(std::move(write));
            stack_.push_back(open);
            pendingTrim_ = tok.trimAfter.value_or(trims_.blockOpenAfter);
            return;
        }
        case DirectiveKind::MacroDef:
        {
            if (!stack_.empty())
            {
                error(tok.loc,
                      reltpl::diag::MacroNotTopLevel,
                      std::string("macro definition is only allowed at the top level (found "
                                  "inside '") +
                          directiveKindToString(stack_.back().directive) + "')");
                return;
            }
            auto def = parseMacroHeader(tok.text, tok.loc);
            if (!def)
                return;
            trimPrecedingText(tok.trimBefore.value_or(trims_.macroOpenBefore));
            OpenConstruct open{DirectiveKind::MacroDef, def.get(), def->body.get(), tok.loc};
            current().children.push_back(std::move(def));
            stack_.push_back(open);
            pendingTrim_ = tok.trimAfter.value_or(trims_.macroOpenAfter);
            return;
        }
        case DirectiveKind::End:
        case DirectiveKind::EndMacro:
            return;
        case DirectiveKind::Unknown:
            error(tok.loc,
                  reltpl::diag::UnknownDirective,
                  tok.keyword.empty() ? std::string("empty directive")
                                      : "unknown directive '" + tok.keyword + "'");
            return;
    }
}

void Parser::handleClose(Token &tok)
{
    const char *found = directiveKindToString(tok.directive);
    if (!tok.text.empty())
    {
        error(tok.loc,
              reltpl::diag::MalformedClause,
              std::string("unexpected '") + tok.text + "' after '" + found + "'");
        return;
    }
    if (stack_.empty())
    {
        error(tok.loc,
              reltpl::diag::UnexpectedClose,
              std::string("'") + found + "' without an open directive");
        return;
    }

    const OpenConstruct open = stack_.back();
    const bool closesMacro = tok.directive == DirectiveKind::EndMacro;
    if (closesMacro != (open.directive == DirectiveKind::MacroDef))
    {
        error(tok.loc,
              reltpl::diag::MismatchedClose,
              std::string("mismatched '") + found + "': expected '" + closerFor(open.directive) +
                  "' to close '" + directiveKindToString(open.directive) + "' opened at line " +
                  lineOf(open.loc));
        return;
    }

    trimPrecedingText(
        tok.trimBefore.value_or(closesMacro ? trims_.macroEndBefore : trims_.blockEndBefore));
    stack_.pop_back();
    pendingTrim_ =
        tok.trimAfter.value_or(closesMacro ? trims_.macroEndAfter : trims_.blockEndAfter);
}

} // namespace reltpl::frontends::tpl
