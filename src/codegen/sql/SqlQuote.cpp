//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "codegen/sql/SqlQuote.hpp"

#include <vector>

namespace reltpl::codegen::sql
{

std::string quoteLiteral(std::string_view text)
{
    std::vector<std::string> pieces;
    std::string run;
    bool haveRun = false;

    auto flush = [&]() {
        if (!haveRun)
            return;
        pieces.push_back("'" + run + "'");
        run.clear();
        haveRun = false;
    };

    for (char c : text)
    {
        if (c == '\n' || c == '\r')
        {
            flush();
            pieces.push_back(c == '\n' ? "x'0a'" : "x'0d'");
            continue;
        }
        if (c == '\'')
            run += "''";
        else
            run.push_back(c);
        haveRun = true;
    }
    flush();

    // A lone blob literal would make the expression a BLOB; lead with text.
    if (pieces.empty() || pieces.front().front() == 'x')
        pieces.insert(pieces.begin(), "''");

    std::string out = pieces.front();
    for (size_t i = 1; i < pieces.size(); ++i)
        out += " || " + pieces[i];
    return out;
}

std::string quoteIdentifier(std::string_view name)
{
    std::string out = "\"";
    for (char c : name)
    {
        if (c == '"')
            out += "\"\"";
        else
            out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string quoteQualifiedName(std::string_view name)
{
    size_t dot = name.find('.');
    if (dot == std::string_view::npos)
        return quoteIdentifier(name);
    return quoteIdentifier(name.substr(0, dot)) + "." + quoteIdentifier(name.substr(dot + 1));
}

std::string escapeFormat(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        if (c == '%')
            out += "%%";
        else
            out.push_back(c);
    }
    return out;
}

} // namespace reltpl::codegen::sql
