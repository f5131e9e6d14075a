//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.cpp
/// @brief Implementation of the template body lexer.
///
/// @see Lexer.hpp for the class interface
///
//===----------------------------------------------------------------------===//

#include "frontends/tpl/Lexer.hpp"

#include "support/diag_codes.hpp"

#include <cctype>

namespace reltpl::frontends::tpl
{

//===----------------------------------------------------------------------===//
// Kind to string conversion
//===----------------------------------------------------------------------===//

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Eof:
            return "eof";
        case TokenKind::Error:
            return "error";
        case TokenKind::Literal:
            return "literal";
        case TokenKind::DirectiveOpen:
            return "directive_open";
        case TokenKind::DirectiveClose:
            return "directive_close";
        case TokenKind::MacroCallMarker:
            return "macro_call";
        case TokenKind::Substitution:
            return "substitution";
    }
    return "unknown";
}

const char *directiveKindToString(DirectiveKind kind)
{
    switch (kind)
    {
        case DirectiveKind::Loop:
            return "FROM";
        case DirectiveKind::Write:
            return "WRITE";
        case DirectiveKind::MacroDef:
            return "macro";
        case DirectiveKind::End:
            return "END";
        case DirectiveKind::EndMacro:
            return "endmacro";
        case DirectiveKind::Unknown:
            return "unknown";
    }
    return "unknown";
}

namespace
{

std::string_view trimView(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

bool isIdentChar(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string toLower(std::string_view s)
{
    std::string out(s);
    for (char &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

/// @brief Amount encoded by a run of trim marker characters.
/// @details `+` disables trimming; otherwise the amount is the number of `-`.
unsigned trimAmount(std::string_view marker)
{
    if (marker.find('+') != std::string_view::npos)
        return 0;
    return static_cast<unsigned>(marker.size());
}

} // namespace

//===----------------------------------------------------------------------===//
// Construction and character access
//===----------------------------------------------------------------------===//

Lexer::Lexer(std::string source, uint32_t fileId, reltpl::support::DiagnosticEngine &diag)
    : fileId_(fileId), diag_(diag)
{
    SourceSegment seg;
    seg.text = std::move(source);
    segments_.push_back(std::move(seg));
}

Lexer::Lexer(std::vector<SourceSegment> segments,
             uint32_t fileId,
             reltpl::support::DiagnosticEngine &diag)
    : segments_(std::move(segments)), fileId_(fileId), diag_(diag)
{
    if (!segments_.empty())
    {
        line_ = segments_.front().line;
        column_ = segments_.front().column;
    }
}

char Lexer::peekChar(size_t offset) const
{
    if (segment_ >= segments_.size())
        return '\0';
    const std::string &text = segments_[segment_].text;
    if (pos_ + offset >= text.size())
        return '\0';
    return text[pos_ + offset];
}

char Lexer::getChar()
{
    if (atSegmentEnd())
        return '\0';
    char c = segments_[segment_].text[pos_++];
    if (c == '\n')
    {
        ++line_;
        column_ = 1;
    }
    else
    {
        ++column_;
    }
    return c;
}

bool Lexer::atSegmentEnd() const
{
    return segment_ >= segments_.size() || pos_ >= segments_[segment_].text.size();
}

bool Lexer::startsWith(std::string_view s) const
{
    if (segment_ >= segments_.size())
        return false;
    return std::string_view(segments_[segment_].text).substr(pos_, s.size()) == s;
}

bool Lexer::atLineStart() const
{
    return pos_ == 0 || segments_[segment_].text[pos_ - 1] == '\n';
}

reltpl::support::SourceLoc Lexer::currentLoc() const
{
    return {fileId_, line_, column_};
}

size_t Lexer::currentOffset() const
{
    if (segment_ >= segments_.size())
        return segments_.empty() ? 0 : segments_.back().offset + segments_.back().text.size();
    return segments_[segment_].offset + pos_;
}

void Lexer::reportError(reltpl::support::SourceLoc loc,
                        std::string_view code,
                        const std::string &message)
{
    hasError_ = true;
    diag_.error(loc, code, message);
}

//===----------------------------------------------------------------------===//
// Scanning
//===----------------------------------------------------------------------===//

void Lexer::lexLiteral(std::string &text)
{
    while (!atSegmentEnd())
    {
        if (startsWith("{%") || startsWith("{{") || startsWith("{#"))
            break;
        if (atLineStart())
        {
            size_t indent = 0;
            while (peekChar(indent) == ' ' || peekChar(indent) == '\t')
                ++indent;
            if (std::string_view(segments_[segment_].text).substr(pos_ + indent, 5) == "%% %%")
            {
                for (size_t i = 0; i < indent; ++i)
                    text.push_back(getChar());
                // Drop the escaping "%% " and keep the rest of the line.
                getChar();
                getChar();
                getChar();
                continue;
            }
        }
        text.push_back(getChar());
    }
}

bool Lexer::skipComment()
{
    reltpl::support::SourceLoc startLoc = currentLoc();
    size_t startOffset = currentOffset();

    getChar();
    getChar();

    int depth = 1;
    while (!atSegmentEnd() && depth > 0)
    {
        if (startsWith("{#"))
        {
            getChar();
            getChar();
            ++depth;
        }
        else if (startsWith("#}"))
        {
            getChar();
            getChar();
            --depth;
        }
        else
        {
            getChar();
        }
    }

    if (depth > 0)
    {
        reportError(startLoc,
                    reltpl::diag::UnterminatedComment,
                    "unterminated comment '{#' opened at byte offset " +
                        std::to_string(startOffset));
        return false;
    }
    return true;
}

std::optional<std::string> Lexer::scanToClose(std::string_view close)
{
    std::string raw;
    char quote = 0;
    while (!atSegmentEnd())
    {
        char c = peekChar();
        if (quote != 0)
        {
            raw.push_back(getChar());
            if (c == quote)
                quote = 0;
            continue;
        }
        if (c == '\'' || c == '"')
        {
            quote = c;
            raw.push_back(getChar());
            continue;
        }
        if (startsWith(close))
        {
            for (size_t i = 0; i < close.size(); ++i)
                getChar();
            return raw;
        }
        raw.push_back(getChar());
    }
    return std::nullopt;
}

Token Lexer::lexDirective()
{
    Token tok;
    tok.loc = currentLoc();
    tok.offset = currentOffset();

    getChar();
    getChar();

    std::string leading;
    while (leading.size() < 3 && (peekChar() == '-' || peekChar() == '+'))
        leading.push_back(getChar());
    if (!leading.empty())
        tok.trimBefore = trimAmount(leading);

    auto raw = scanToClose("%}");
    if (!raw)
    {
        reportError(tok.loc,
                    reltpl::diag::UnterminatedDirective,
                    "unterminated directive '{%' opened at byte offset " +
                        std::to_string(tok.offset));
        tok.kind = TokenKind::Error;
        return tok;
    }

    std::string_view body(*raw);
    size_t markerLen = 0;
    while (markerLen < 3 && markerLen < body.size() &&
           (body[body.size() - 1 - markerLen] == '-' || body[body.size() - 1 - markerLen] == '+'))
        ++markerLen;
    if (markerLen > 0)
    {
        tok.trimAfter = trimAmount(body.substr(body.size() - markerLen));
        body.remove_suffix(markerLen);
    }

    body = trimView(body);
    size_t kwLen = 0;
    while (kwLen < body.size() && isIdentChar(body[kwLen]))
        ++kwLen;
    tok.keyword = std::string(body.substr(0, kwLen));
    tok.text = std::string(trimView(body.substr(kwLen)));

    const std::string kw = toLower(tok.keyword);
    if (kw == "from")
    {
        tok.kind = TokenKind::DirectiveOpen;
        tok.directive = DirectiveKind::Loop;
    }
    else if (kw == "write")
    {
        tok.kind = TokenKind::DirectiveOpen;
        tok.directive = DirectiveKind::Write;
    }
    else if (kw == "macro")
    {
        tok.kind = TokenKind::DirectiveOpen;
        tok.directive = DirectiveKind::MacroDef;
    }
    else if (kw == "end")
    {
        tok.kind = TokenKind::DirectiveClose;
        tok.directive = DirectiveKind::End;
    }
    else if (kw == "endmacro")
    {
        tok.kind = TokenKind::DirectiveClose;
        tok.directive = DirectiveKind::EndMacro;
    }
    else
    {
        tok.kind = TokenKind::DirectiveOpen;
        tok.directive = DirectiveKind::Unknown;
    }
    return tok;
}

Token Lexer::lexEscape()
{
    Token tok;
    tok.loc = currentLoc();
    tok.offset = currentOffset();

    getChar();
    getChar();

    auto raw = scanToClose("}}");
    if (!raw)
    {
        reportError(tok.loc,
                    reltpl::diag::UnterminatedSubstitution,
                    "unterminated substitution '{{' opened at byte offset " +
                        std::to_string(tok.offset));
        tok.kind = TokenKind::Error;
        return tok;
    }

    std::string_view content = trimView(*raw);
    if (content.size() > 4 && toLower(content.substr(0, 4)) == "call" &&
        std::isspace(static_cast<unsigned char>(content[4])))
    {
        tok.kind = TokenKind::MacroCallMarker;
        tok.keyword = std::string(content.substr(0, 4));
        tok.text = std::string(trimView(content.substr(4)));
        return tok;
    }

    tok.kind = TokenKind::Substitution;
    tok.text = std::string(content);
    return tok;
}

Token Lexer::lexToken()
{
    while (true)
    {
        if (hasError_)
        {
            Token eof;
            eof.loc = currentLoc();
            eof.offset = currentOffset();
            return eof;
        }

        if (atSegmentEnd())
        {
            if (segment_ + 1 >= segments_.size())
            {
                Token eof;
                eof.loc = currentLoc();
                eof.offset = currentOffset();
                return eof;
            }
            ++segment_;
            pos_ = 0;
            line_ = segments_[segment_].line;
            column_ = segments_[segment_].column;
            continue;
        }

        if (startsWith("{#"))
        {
            if (!skipComment())
            {
                Token err;
                err.kind = TokenKind::Error;
                err.loc = currentLoc();
                err.offset = currentOffset();
                return err;
            }
            continue;
        }
        if (startsWith("{%"))
            return lexDirective();
        if (startsWith("{{"))
            return lexEscape();

        Token tok;
        tok.kind = TokenKind::Literal;
        tok.loc = currentLoc();
        tok.offset = currentOffset();
        lexLiteral(tok.text);
        return tok;
    }
}

Token Lexer::next()
{
    if (peeked_)
    {
        Token tok = std::move(*peeked_);
        peeked_.reset();
        return tok;
    }
    return lexToken();
}

const Token &Lexer::peek()
{
    if (!peeked_)
        peeked_ = lexToken();
    return *peeked_;
}

} // namespace reltpl::frontends::tpl
