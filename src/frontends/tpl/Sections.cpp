//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/tpl/Sections.cpp
// Purpose: Line-oriented scanner for `%% <section>` separators.
//
//===----------------------------------------------------------------------===//

#include "frontends/tpl/Sections.hpp"

#include "support/diag_codes.hpp"

namespace reltpl::frontends::tpl
{
namespace
{

enum class SectionState
{
    Done,
    Init,
    Code,
    Fini,
};

bool isBlank(char c)
{
    return c == ' ' || c == '\t' || c == '\r';
}

/// @brief Recognise `%% <word>` and return the word; empty when not a separator.
std::string_view separatorWord(std::string_view line)
{
    size_t i = 0;
    while (i < line.size() && isBlank(line[i]))
        ++i;
    if (line.substr(i, 2) != "%%")
        return {};
    i += 2;
    size_t wsStart = i;
    while (i < line.size() && isBlank(line[i]))
        ++i;
    if (i == wsStart)
        return {};
    size_t wordStart = i;
    while (i < line.size() && ((line[i] >= 'a' && line[i] <= 'z') || (line[i] >= 'A' && line[i] <= 'Z')))
        ++i;
    std::string_view word = line.substr(wordStart, i - wordStart);
    while (i < line.size() && isBlank(line[i]))
        ++i;
    if (i != line.size())
        return {};
    return word;
}

/// @brief Rewrite a leading `%% %%` to `%%` for raw SQL sections.
std::string unescapeRawSection(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size())
    {
        size_t eol = text.find('\n', pos);
        size_t end = eol == std::string_view::npos ? text.size() : eol + 1;
        std::string_view line = text.substr(pos, end - pos);
        size_t i = 0;
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t'))
            ++i;
        if (line.substr(i, 5) == "%% %%")
        {
            out.append(line.substr(0, i));
            out.append(line.substr(i + 3));
        }
        else
        {
            out.append(line);
        }
        pos = end;
    }
    return out;
}

std::string joinSegments(const std::vector<SourceSegment> &segments, bool reverse)
{
    std::string out;
    for (size_t i = 0; i < segments.size(); ++i)
    {
        const auto &seg = reverse ? segments[segments.size() - 1 - i] : segments[i];
        if (!out.empty() && out.back() != '\n')
            out.push_back('\n');
        out += seg.text;
    }
    return out;
}

} // namespace

std::string TemplateSections::initScript() const
{
    return joinSegments(init, false);
}

std::string TemplateSections::finiScript() const
{
    return joinSegments(fini, true);
}

std::optional<TemplateSections> splitSections(std::string_view source,
                                              uint32_t fileId,
                                              reltpl::support::DiagnosticEngine &diag)
{
    using reltpl::support::SourceLoc;

    TemplateSections out;
    SectionState state = SectionState::Done;
    size_t sectionStart = 0;
    uint32_t sectionLine = 1;

    auto closeSection = [&](size_t end) {
        if (state == SectionState::Done)
            return;
        if (end > sectionStart && source[end - 1] == '\n')
            --end;
        if (end > sectionStart && source[end - 1] == '\r')
            --end;
        SourceSegment seg;
        seg.offset = sectionStart;
        seg.line = sectionLine;
        seg.column = 1;
        std::string_view text = end > sectionStart ? source.substr(sectionStart, end - sectionStart)
                                                   : std::string_view{};
        switch (state)
        {
            case SectionState::Init:
                seg.text = unescapeRawSection(text);
                out.init.push_back(std::move(seg));
                break;
            case SectionState::Fini:
                seg.text = unescapeRawSection(text);
                out.fini.push_back(std::move(seg));
                break;
            case SectionState::Code:
                seg.text = std::string(text);
                out.code.push_back(std::move(seg));
                break;
            case SectionState::Done:
                break;
        }
    };

    size_t pos = 0;
    uint32_t line = 1;
    while (pos < source.size())
    {
        size_t eol = source.find('\n', pos);
        size_t lineEnd = eol == std::string_view::npos ? source.size() : eol;
        size_t next = eol == std::string_view::npos ? source.size() : eol + 1;
        std::string_view word = separatorWord(source.substr(pos, lineEnd - pos));
        if (!word.empty())
        {
            SectionState nextState;
            if (word == "init")
                nextState = SectionState::Init;
            else if (word == "code")
                nextState = SectionState::Code;
            else if (word == "fini")
                nextState = SectionState::Fini;
            else if (word == "done")
                nextState = SectionState::Done;
            else
            {
                diag.error(SourceLoc{fileId, line, 1},
                           reltpl::diag::UnknownSection,
                           "unknown section '" + std::string(word) +
                               "' (expected init, code, fini or done)");
                return std::nullopt;
            }
            closeSection(pos);
            state = nextState;
            sectionStart = next;
            sectionLine = line + 1;
        }
        pos = next;
        ++line;
    }
    closeSection(source.size());
    return out;
}

} // namespace reltpl::frontends::tpl
