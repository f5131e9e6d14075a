//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.cpp
// Purpose: Diagnostic engine and printer.
//
//===----------------------------------------------------------------------===//

#include "support/diagnostics.hpp"

#include "support/source_manager.hpp"

namespace reltpl::support
{

const char *severityName(Severity severity)
{
    switch (severity)
    {
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}

Diagnostic makeError(SourceLoc loc, std::string msg, std::string_view code)
{
    return Diagnostic{Severity::Error, std::move(msg), loc, std::string(code)};
}

void printDiag(const Diagnostic &diag, std::ostream &os, const SourceManager *sm)
{
    std::string_view path = sm && diag.loc.isValid() ? sm->getPath(diag.loc.file_id) : "";
    if (!path.empty())
    {
        os << path;
        if (diag.loc.hasLine())
        {
            os << ':' << diag.loc.line;
            if (diag.loc.hasColumn())
                os << ':' << diag.loc.column;
        }
        os << ": ";
    }
    os << severityName(diag.severity);
    if (!diag.code.empty())
        os << '[' << diag.code << ']';
    os << ": " << diag.message << '\n';

    if (path.empty() || !diag.loc.hasLine())
        return;
    std::string_view line = sm->lineText(diag.loc.file_id, diag.loc.line);
    if (line.empty())
        return;
    os << "  " << line << '\n';
    if (diag.loc.hasColumn() && diag.loc.column <= line.size() + 1)
    {
        // Keep tabs so the caret lines up with the echoed text.
        std::string pad;
        for (uint32_t i = 0; i + 1 < diag.loc.column; ++i)
            pad.push_back(line[i] == '\t' ? '\t' : ' ');
        os << "  " << pad << "^\n";
    }
}

void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    diags_.push_back(std::move(d));
}

void DiagnosticEngine::error(SourceLoc loc, std::string_view code, std::string message)
{
    report(makeError(loc, std::move(message), code));
}

void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
        printDiag(d, os, sm);
}

const Diagnostic *DiagnosticEngine::firstError() const
{
    for (const auto &d : diags_)
    {
        if (d.severity == Severity::Error)
            return &d;
    }
    return nullptr;
}

} // namespace reltpl::support
