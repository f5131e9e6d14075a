//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/tpl/Parser_Clauses.cpp
// Purpose: Parsing of directive clauses (FROM/WRITE/macro headers), inline
//          escapes, macro calls and embedded raw SQL.
// Key invariants: Keywords are only recognised at parenthesis depth zero and
//                 outside quoted strings.
//
//===----------------------------------------------------------------------===//

#include "frontends/tpl/Parser.hpp"

#include "support/diag_codes.hpp"

#include <algorithm>
#include <cctype>

namespace reltpl::frontends::tpl
{

namespace
{

constexpr size_t npos = std::string_view::npos;

bool isIdentStart(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

/// @brief Length of the identifier starting at @p pos, 0 when none.
size_t identLength(std::string_view text, size_t pos)
{
    if (pos >= text.size() || !isIdentStart(text[pos]))
        return 0;
    size_t end = pos + 1;
    while (end < text.size() && isIdentChar(text[end]))
        ++end;
    return end - pos;
}

bool isIdentifier(std::string_view text)
{
    return !text.empty() && identLength(text, 0) == text.size();
}

/// @brief Find a top-level, whole-word, case-insensitive keyword.
size_t findKeyword(std::string_view text, std::string_view kw, size_t from)
{
    char quote = 0;
    int depth = 0;
    for (size_t i = from; i < text.size(); ++i)
    {
        char c = text[i];
        if (quote != 0)
        {
            if (c == quote)
                quote = 0;
            continue;
        }
        if (c == '\'' || c == '"')
        {
            quote = c;
            continue;
        }
        if (c == '(')
        {
            ++depth;
            continue;
        }
        if (c == ')')
        {
            if (depth > 0)
                --depth;
            continue;
        }
        if (depth > 0 || !isIdentStart(c))
            continue;
        if (i > 0)
        {
            char prev = text[i - 1];
            if (isIdentChar(prev) || prev == '@' || prev == '$' || prev == '.')
                continue;
        }
        size_t len = identLength(text, i);
        if (equalsIgnoreCase(text.substr(i, len), kw))
            return i;
        i += len - 1;
    }
    return npos;
}

/// @brief Find top-level `ORDER BY`; @p bodyStart receives the offset after BY.
size_t findOrderBy(std::string_view text, size_t &bodyStart)
{
    size_t from = 0;
    while (true)
    {
        size_t pos = findKeyword(text, "ORDER", from);
        if (pos == npos)
            return npos;
        size_t i = pos + 5;
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])))
            ++i;
        size_t len = identLength(text, i);
        if (i > pos + 5 && equalsIgnoreCase(text.substr(i, len), "BY"))
        {
            bodyStart = i + len;
            return pos;
        }
        from = pos + 5;
    }
}

/// @brief Find top-level `SEP` followed by a quoted string.
/// @details A bare `sep` elsewhere is an ordinary column name.
size_t findSeparator(std::string_view text)
{
    size_t from = 0;
    while (true)
    {
        size_t pos = findKeyword(text, "SEP", from);
        if (pos == npos)
            return npos;
        size_t i = pos + 3;
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])))
            ++i;
        if (i < text.size() && text[i] == '\'')
            return pos;
        from = pos + 3;
    }
}

/// @brief Offset of the parenthesis closing the one at @p open, or npos.
size_t matchingParen(std::string_view text, size_t open)
{
    char quote = 0;
    int depth = 0;
    for (size_t i = open; i < text.size(); ++i)
    {
        char c = text[i];
        if (quote != 0)
        {
            if (c == quote)
                quote = 0;
            continue;
        }
        if (c == '\'' || c == '"')
            quote = c;
        else if (c == '(')
            ++depth;
        else if (c == ')' && --depth == 0)
            return i;
    }
    return npos;
}

/// @brief Split on top-level commas.
std::vector<std::string_view> splitTopLevel(std::string_view text)
{
    std::vector<std::string_view> parts;
    char quote = 0;
    int depth = 0;
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (quote != 0)
        {
            if (c == quote)
                quote = 0;
            continue;
        }
        if (c == '\'' || c == '"')
            quote = c;
        else if (c == '(')
            ++depth;
        else if (c == ')' && depth > 0)
            --depth;
        else if (c == ',' && depth == 0)
        {
            parts.push_back(trim(text.substr(start, i - start)));
            start = i + 1;
        }
    }
    parts.push_back(trim(text.substr(start)));
    return parts;
}

/// @brief Decode a complete single-quoted SQL string literal.
std::optional<std::string> unquoteLiteral(std::string_view text)
{
    if (text.size() < 2 || text.front() != '\'' || text.back() != '\'')
        return std::nullopt;
    std::string out;
    for (size_t i = 1; i + 1 < text.size(); ++i)
    {
        if (text[i] == '\'')
        {
            if (i + 2 >= text.size() || text[i + 1] != '\'')
                return std::nullopt;
            ++i;
        }
        out.push_back(text[i]);
    }
    return out;
}

void appendRaw(SqlFragments &out, std::string_view text)
{
    if (text.empty())
        return;
    if (!out.empty() && out.back().kind == SqlFragment::Kind::Raw)
    {
        out.back().text += text;
        return;
    }
    SqlFragment frag;
    frag.text = std::string(text);
    out.push_back(std::move(frag));
}

} // namespace

//===----------------------------------------------------------------------===//
// Raw SQL
//===----------------------------------------------------------------------===//

std::optional<SqlFragments> Parser::parseSql(std::string_view text, SourceLoc loc)
{
    SqlFragments out;
    size_t i = 0;
    while (i < text.size())
    {
        char c = text[i];
        if (c == '\'' || c == '"')
        {
            size_t end = text.find(c, i + 1);
            end = end == npos ? text.size() : end + 1;
            appendRaw(out, text.substr(i, end - i));
            i = end;
            continue;
        }

        const bool wordStart = i == 0 || (!isIdentChar(text[i - 1]) && text[i - 1] != '.');
        if (c == '@' && wordStart && identLength(text, i + 1) > 0)
        {
            size_t len = identLength(text, i + 1);
            SqlFragment frag;
            frag.kind = SqlFragment::Kind::Param;
            frag.text = std::string(text.substr(i, len + 1));
            frag.name = std::string(text.substr(i + 1, len));
            out.push_back(std::move(frag));
            i += len + 1;
            continue;
        }

        if (c == '$' && wordStart && identLength(text, i + 1) > 0)
        {
            size_t len = identLength(text, i + 1);
            size_t dot = i + 1 + len;
            size_t colLen = dot < text.size() && text[dot] == '.' ? identLength(text, dot + 1) : 0;
            if (colLen == 0)
            {
                error(loc,
                      reltpl::diag::MalformedClause,
                      "'" + std::string(text.substr(i, len + 1)) +
                          "' must be followed by '.column'");
                return std::nullopt;
            }
            SqlFragment frag;
            frag.kind = SqlFragment::Kind::RowField;
            frag.strict = true;
            frag.text = std::string(text.substr(i, dot + 1 + colLen - i));
            frag.name = std::string(text.substr(i + 1, len));
            frag.column = std::string(text.substr(dot + 1, colLen));
            out.push_back(std::move(frag));
            i = dot + 1 + colLen;
            continue;
        }

        if (wordStart && isIdentStart(c))
        {
            size_t len = identLength(text, i);
            size_t dot = i + len;
            size_t colLen = dot < text.size() && text[dot] == '.' ? identLength(text, dot + 1) : 0;
            if (colLen > 0)
            {
                SqlFragment frag;
                frag.kind = SqlFragment::Kind::RowField;
                frag.text = std::string(text.substr(i, len + 1 + colLen));
                frag.name = std::string(text.substr(i, len));
                frag.column = std::string(text.substr(dot + 1, colLen));
                out.push_back(std::move(frag));
                i = dot + 1 + colLen;
                continue;
            }
            appendRaw(out, text.substr(i, len));
            i += len;
            continue;
        }

        appendRaw(out, text.substr(i, 1));
        ++i;
    }
    return out;
}

//===----------------------------------------------------------------------===//
// Inline escapes and macro calls
//===----------------------------------------------------------------------===//

NodePtr Parser::parseValue(std::string_view text, SourceLoc loc)
{
    std::string_view t = trim(text);
    if (t.empty())
    {
        error(loc, reltpl::diag::InvalidSubstitution, "empty substitution");
        return nullptr;
    }

    if (t.front() == '@' && isIdentifier(t.substr(1)))
        return std::make_unique<ParamRefNode>(loc, std::string(t.substr(1)));

    if (auto literal = unquoteLiteral(t))
        return std::make_unique<TextNode>(loc, std::move(*literal));

    if (isIdentifier(t))
        return std::make_unique<FieldRefNode>(loc, std::string(), std::string(t));

    std::string_view qualified = t.front() == '$' ? t.substr(1) : t;
    size_t dot = qualified.find('.');
    if (dot != npos && isIdentifier(qualified.substr(0, dot)) &&
        isIdentifier(qualified.substr(dot + 1)))
    {
        return std::make_unique<FieldRefNode>(
            loc, std::string(qualified.substr(0, dot)), std::string(qualified.substr(dot + 1)));
    }

    auto fragments = parseSql(t, loc);
    if (!fragments)
        return nullptr;
    return std::make_unique<SqlExprNode>(loc, std::move(*fragments));
}

std::unique_ptr<MacroCallNode> Parser::parseMacroCall(std::string_view text, SourceLoc loc)
{
    std::string_view t = trim(text);
    size_t nameLen = identLength(t, 0);
    if (nameLen == 0)
    {
        error(loc, reltpl::diag::InvalidSubstitution, "expected macro name after 'call'");
        return nullptr;
    }
    auto call = std::make_unique<MacroCallNode>(loc);
    call->name = std::string(t.substr(0, nameLen));

    std::string_view rest = trim(t.substr(nameLen));
    if (rest.empty() || rest.front() != '(')
    {
        error(loc,
              reltpl::diag::InvalidSubstitution,
              "expected '(' after macro name '" + call->name + "'");
        return nullptr;
    }
    size_t close = matchingParen(rest, 0);
    if (close == npos || close + 1 != rest.size())
    {
        error(loc,
              reltpl::diag::InvalidSubstitution,
              "malformed argument list in call to '" + call->name + "'");
        return nullptr;
    }

    std::string_view inner = trim(rest.substr(1, close - 1));
    if (inner.empty())
        return call;
    for (std::string_view arg : splitTopLevel(inner))
    {
        if (arg.empty())
        {
            error(loc,
                  reltpl::diag::InvalidSubstitution,
                  "empty argument in call to '" + call->name + "'");
            return nullptr;
        }
        NodePtr value = parseValue(arg, loc);
        if (!value)
            return nullptr;
        call->args.push_back(std::move(value));
    }
    return call;
}

//===----------------------------------------------------------------------===//
// Directive headers
//===----------------------------------------------------------------------===//

std::optional<std::string> Parser::parseSeparator(std::string_view quoted, SourceLoc loc)
{
    if (quoted.size() < 2 || quoted.front() != '\'' || quoted.back() != '\'')
    {
        error(loc, reltpl::diag::InvalidSeparator, "SEP expects a single-quoted string");
        return std::nullopt;
    }
    std::string out;
    for (size_t i = 1; i + 1 < quoted.size(); ++i)
    {
        char c = quoted[i];
        if (c == '\'')
        {
            if (i + 2 >= quoted.size() || quoted[i + 1] != '\'')
            {
                error(loc, reltpl::diag::InvalidSeparator, "unescaped quote in SEP string");
                return std::nullopt;
            }
            out.push_back('\'');
            ++i;
            continue;
        }
        if (c == '\\')
        {
            char esc = i + 2 < quoted.size() ? quoted[i + 1] : '\0';
            if (esc == 'n')
                out.push_back('\n');
            else if (esc == '\\')
                out.push_back('\\');
            else
            {
                error(loc,
                      reltpl::diag::InvalidSeparator,
                      std::string("invalid escape '\\") + (esc ? std::string(1, esc) : "") +
                          "' in SEP string");
                return std::nullopt;
            }
            ++i;
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::optional<RowSource> Parser::parseRowSource(std::string_view text,
                                                SourceLoc loc,
                                                std::string *separator)
{
    RowSource src;
    src.loc = loc;
    std::string_view rest = trim(text);

    if (!rest.empty() && rest.front() == '(')
    {
        size_t close = matchingParen(rest, 0);
        if (close == npos)
        {
            error(loc, reltpl::diag::MalformedClause, "unbalanced parentheses in FROM source");
            return std::nullopt;
        }
        auto sub = parseSql(trim(rest.substr(1, close - 1)), loc);
        if (!sub)
            return std::nullopt;
        src.subquery = std::move(*sub);
        rest = rest.substr(close + 1);
    }
    else
    {
        size_t len = identLength(rest, 0);
        if (len == 0)
        {
            error(loc, reltpl::diag::MalformedClause, "expected table name after 'FROM'");
            return std::nullopt;
        }
        src.name = std::string(rest.substr(0, len));
        size_t end = len;
        if (end < rest.size() && rest[end] == '.')
        {
            size_t tableLen = identLength(rest, end + 1);
            if (tableLen == 0)
            {
                error(loc, reltpl::diag::MalformedClause, "expected table name after schema");
                return std::nullopt;
            }
            src.name = std::string(rest.substr(end + 1, tableLen));
            end += 1 + tableLen;
        }
        src.table = std::string(rest.substr(0, end));
        rest = rest.substr(end);
    }

    rest = trim(rest);
    size_t asLen = identLength(rest, 0);
    if (asLen == 2 && equalsIgnoreCase(rest.substr(0, 2), "AS"))
    {
        rest = trim(rest.substr(2));
        if (!rest.empty() && rest.front() == '$')
            rest.remove_prefix(1);
        size_t aliasLen = identLength(rest, 0);
        if (aliasLen == 0)
        {
            error(loc, reltpl::diag::MalformedClause, "expected alias name after 'AS'");
            return std::nullopt;
        }
        src.name = std::string(rest.substr(0, aliasLen));
        rest = trim(rest.substr(aliasLen));
    }
    else if (src.subquery)
    {
        error(loc, reltpl::diag::MalformedClause, "sub-query source requires 'AS name'");
        return std::nullopt;
    }

    size_t orderBody = 0;
    const size_t wherePos = findKeyword(rest, "WHERE", 0);
    const size_t orderPos = findOrderBy(rest, orderBody);
    const size_t sepPos = findSeparator(rest);

    size_t first = std::min({wherePos, orderPos, sepPos});
    std::string_view leading = trim(rest.substr(0, first == npos ? rest.size() : first));
    if (!leading.empty())
    {
        error(loc,
              reltpl::diag::MalformedClause,
              "unexpected '" + std::string(leading) + "' in FROM clause");
        return std::nullopt;
    }

    auto ordered = [](size_t a, size_t b) { return a == npos || b == npos || a < b; };
    if (!ordered(wherePos, orderPos) || !ordered(wherePos, sepPos) || !ordered(orderPos, sepPos))
    {
        error(loc,
              reltpl::diag::MalformedClause,
              "clauses must appear in the order WHERE, ORDER BY, SEP");
        return std::nullopt;
    }

    auto clauseEnd = [&](size_t pos) {
        size_t end = rest.size();
        for (size_t other : {wherePos, orderPos, sepPos})
        {
            if (other != npos && other > pos && other < end)
                end = other;
        }
        return end;
    };

    if (wherePos != npos)
    {
        size_t bodyStart = wherePos + 5;
        std::string_view cond = trim(rest.substr(bodyStart, clauseEnd(wherePos) - bodyStart));
        if (cond.empty())
        {
            error(loc, reltpl::diag::MalformedClause, "empty WHERE clause");
            return std::nullopt;
        }
        auto where = parseSql(cond, loc);
        if (!where)
            return std::nullopt;
        src.where = std::move(*where);
    }

    if (orderPos != npos)
    {
        std::string_view order = trim(rest.substr(orderBody, clauseEnd(orderPos) - orderBody));
        size_t colLen = identLength(order, 0);
        if (colLen == 0)
        {
            error(loc, reltpl::diag::MalformedClause, "expected column name after 'ORDER BY'");
            return std::nullopt;
        }
        src.orderBy = std::string(order.substr(0, colLen));
        std::string_view dir = trim(order.substr(colLen));
        if (dir.empty() || equalsIgnoreCase(dir, "ASC"))
            src.direction = SortDirection::Ascending;
        else if (equalsIgnoreCase(dir, "DESC"))
            src.direction = SortDirection::Descending;
        else
        {
            error(loc,
                  reltpl::diag::MalformedClause,
                  "expected ASC or DESC after ORDER BY column, found '" + std::string(dir) + "'");
            return std::nullopt;
        }
    }

    if (sepPos != npos)
    {
        if (!separator)
        {
            error(loc, reltpl::diag::MalformedClause, "'SEP' is only allowed on loops");
            return std::nullopt;
        }
        auto sep = parseSeparator(trim(rest.substr(sepPos + 3)), loc);
        if (!sep)
            return std::nullopt;
        *separator = std::move(*sep);
    }

    return src;
}

std::unique_ptr<MacroDefNode> Parser::parseMacroHeader(std::string_view text, SourceLoc loc)
{
    std::string_view t = trim(text);
    size_t nameLen = identLength(t, 0);
    if (nameLen == 0)
    {
        error(loc, reltpl::diag::MalformedClause, "expected macro name after 'macro'");
        return nullptr;
    }
    auto def = std::make_unique<MacroDefNode>(loc);
    def->name = std::string(t.substr(0, nameLen));
    def->body = std::make_unique<SequenceNode>(loc);

    std::string_view rest = trim(t.substr(nameLen));
    if (rest.empty())
        return def;
    if (rest.front() != '(' || rest.back() != ')')
    {
        error(loc,
              reltpl::diag::MalformedClause,
              "expected parameter list after macro name '" + def->name + "'");
        return nullptr;
    }
    std::string_view inner = trim(rest.substr(1, rest.size() - 2));
    if (inner.empty())
        return def;
    for (std::string_view param : splitTopLevel(inner))
    {
        if (param.size() < 2 || param.front() != '@' || !isIdentifier(param.substr(1)))
        {
            error(loc,
                  reltpl::diag::MalformedClause,
                  "macro parameter must be written as @name, found '" + std::string(param) + "'");
            return nullptr;
        }
        def->params.emplace_back(param.substr(1));
    }
    return def;
}

std::unique_ptr<WriteNode> Parser::parseWriteHeader(std::string_view text, SourceLoc loc)
{
    auto write = std::make_unique<WriteNode>(loc);
    write->body = std::make_unique<SequenceNode>(loc);

    size_t fromPos = findKeyword(text, "FROM", 0);
    std::string_view pathText = trim(text.substr(0, fromPos == npos ? text.size() : fromPos));
    if (pathText.empty())
    {
        error(loc, reltpl::diag::MalformedClause, "expected path expression after 'WRITE'");
        return nullptr;
    }
    auto path = parseSql(pathText, loc);
    if (!path)
        return nullptr;
    write->path = std::move(*path);

    if (fromPos != npos)
    {
        auto source = parseRowSource(text.substr(fromPos + 4), loc, nullptr);
        if (!source)
            return nullptr;
        write->source = std::move(*source);
    }
    return write;
}

} // namespace reltpl::frontends::tpl
