//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/tpl/Schema.cpp
// Purpose: Lexical scanner for CREATE TABLE / CREATE VIEW statements.
//
//===----------------------------------------------------------------------===//

#include "frontends/tpl/Schema.hpp"

#include <cctype>

namespace reltpl::frontends::tpl
{

namespace
{

struct SqlToken
{
    enum class Kind
    {
        Word,   ///< Bare identifier or keyword.
        Quoted, ///< "name", `name` or [name].
        String, ///< 'text'
        Punct,
        Other,
    };

    Kind kind;
    std::string text;
};

std::vector<SqlToken> tokenize(std::string_view sql)
{
    std::vector<SqlToken> out;
    size_t i = 0;
    while (i < sql.size())
    {
        char c = sql[i];
        if (std::isspace(static_cast<unsigned char>(c)))
        {
            ++i;
            continue;
        }
        if (sql.compare(i, 2, "--") == 0)
        {
            size_t eol = sql.find('\n', i);
            i = eol == std::string_view::npos ? sql.size() : eol + 1;
            continue;
        }
        if (sql.compare(i, 2, "/*") == 0)
        {
            size_t end = sql.find("*/", i + 2);
            i = end == std::string_view::npos ? sql.size() : end + 2;
            continue;
        }
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_')
        {
            size_t start = i;
            while (i < sql.size() &&
                   (std::isalnum(static_cast<unsigned char>(sql[i])) || sql[i] == '_' || sql[i] == '$'))
                ++i;
            out.push_back({SqlToken::Kind::Word, std::string(sql.substr(start, i - start))});
            continue;
        }
        if (c == '"' || c == '`' || c == '[' || c == '\'')
        {
            char close = c == '[' ? ']' : c;
            std::string text;
            ++i;
            while (i < sql.size())
            {
                if (sql[i] == close)
                {
                    // Doubled quote characters stand for one.
                    if (close != ']' && i + 1 < sql.size() && sql[i + 1] == close)
                    {
                        text.push_back(close);
                        i += 2;
                        continue;
                    }
                    ++i;
                    break;
                }
                text.push_back(sql[i++]);
            }
            out.push_back({c == '\'' ? SqlToken::Kind::String : SqlToken::Kind::Quoted, text});
            continue;
        }
        if (c == '(' || c == ')' || c == ',' || c == '.' || c == ';')
        {
            out.push_back({SqlToken::Kind::Punct, std::string(1, c)});
            ++i;
            continue;
        }
        out.push_back({SqlToken::Kind::Other, std::string(1, c)});
        ++i;
    }
    return out;
}

bool isWord(const SqlToken &tok, std::string_view word)
{
    if (tok.kind != SqlToken::Kind::Word || tok.text.size() != word.size())
        return false;
    for (size_t i = 0; i < word.size(); ++i)
    {
        if (std::toupper(static_cast<unsigned char>(tok.text[i])) != word[i])
            return false;
    }
    return true;
}

bool isName(const SqlToken &tok)
{
    return tok.kind == SqlToken::Kind::Word || tok.kind == SqlToken::Kind::Quoted;
}

bool isPunct(const SqlToken &tok, char c)
{
    return tok.kind == SqlToken::Kind::Punct && tok.text.size() == 1 && tok.text[0] == c;
}

bool isConstraintKeyword(const SqlToken &tok)
{
    return isWord(tok, "CONSTRAINT") || isWord(tok, "PRIMARY") || isWord(tok, "UNIQUE") ||
           isWord(tok, "CHECK") || isWord(tok, "FOREIGN");
}

/// @brief Read `[schema .] name` at @p i; returns the unqualified name.
bool readQualifiedName(const std::vector<SqlToken> &toks, size_t &i, std::string &name)
{
    if (i >= toks.size() || !isName(toks[i]))
        return false;
    name = toks[i].text;
    ++i;
    if (i + 1 < toks.size() && isPunct(toks[i], '.') && isName(toks[i + 1]))
    {
        name = toks[i + 1].text;
        i += 2;
    }
    return true;
}

/// @brief Parse a parenthesised list starting at toks[i] == '(' and return the
///        leading name of every top-level item that is not a constraint.
std::vector<std::string> readColumnList(const std::vector<SqlToken> &toks, size_t &i)
{
    std::vector<std::string> columns;
    int depth = 0;
    bool itemStart = true;
    for (; i < toks.size(); ++i)
    {
        const SqlToken &tok = toks[i];
        if (isPunct(tok, '('))
        {
            ++depth;
            if (depth == 1)
            {
                itemStart = true;
                continue;
            }
        }
        else if (isPunct(tok, ')'))
        {
            if (--depth == 0)
            {
                ++i;
                break;
            }
        }
        else if (depth == 1 && isPunct(tok, ','))
        {
            itemStart = true;
            continue;
        }

        if (depth == 1 && itemStart)
        {
            if (isName(tok) && !isConstraintKeyword(tok))
                columns.push_back(tok.text);
            itemStart = false;
        }
    }
    return columns;
}

} // namespace

std::string Schema::key(std::string_view name)
{
    size_t dot = name.rfind('.');
    if (dot != std::string_view::npos)
        name = name.substr(dot + 1);
    std::string out(name);
    for (char &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

void Schema::addTable(std::string_view name, std::vector<std::string> columns)
{
    TableInfo info;
    info.name = std::string(name);
    info.columns = std::move(columns);
    info.columnsKnown = true;
    tables_[key(name)] = std::move(info);
}

void Schema::addOpaqueTable(std::string_view name)
{
    TableInfo info;
    info.name = std::string(name);
    tables_[key(name)] = std::move(info);
}

bool Schema::hasTable(std::string_view name) const
{
    return tables_.count(key(name)) != 0;
}

const std::vector<std::string> *Schema::columns(std::string_view table) const
{
    auto it = tables_.find(key(table));
    if (it == tables_.end() || !it->second.columnsKnown)
        return nullptr;
    return &it->second.columns;
}

bool Schema::mayHaveColumn(std::string_view table, std::string_view column) const
{
    const auto *cols = columns(table);
    if (!cols)
        return true;
    const std::string wanted = key(column);
    for (const auto &col : *cols)
    {
        if (key(col) == wanted)
            return true;
    }
    return false;
}

Schema Schema::fromScript(std::string_view sql)
{
    Schema schema;
    const auto toks = tokenize(sql);
    for (size_t i = 0; i < toks.size(); ++i)
    {
        if (!isWord(toks[i], "CREATE"))
            continue;
        size_t j = i + 1;
        if (j < toks.size() && (isWord(toks[j], "TEMP") || isWord(toks[j], "TEMPORARY")))
            ++j;
        bool isVirtual = false;
        if (j < toks.size() && isWord(toks[j], "VIRTUAL"))
        {
            isVirtual = true;
            ++j;
        }
        if (j >= toks.size())
            break;
        const bool isTable = isWord(toks[j], "TABLE");
        const bool isView = isWord(toks[j], "VIEW");
        if (!isTable && !isView)
            continue;
        ++j;
        if (j + 2 < toks.size() && isWord(toks[j], "IF") && isWord(toks[j + 1], "NOT") &&
            isWord(toks[j + 2], "EXISTS"))
            j += 3;

        std::string name;
        if (!readQualifiedName(toks, j, name))
            continue;

        if (isTable && !isVirtual && j < toks.size() && isPunct(toks[j], '('))
            schema.addTable(name, readColumnList(toks, j));
        else if (isView && j < toks.size() && isPunct(toks[j], '('))
            schema.addTable(name, readColumnList(toks, j));
        else
            schema.addOpaqueTable(name);
        i = j > 0 ? j - 1 : j;
    }
    return schema;
}

} // namespace reltpl::frontends::tpl
