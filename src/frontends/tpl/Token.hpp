//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Token.hpp
/// @brief Token kinds and token structure for the template body lexer.
///
/// The body of a template is literal text interleaved with three delimiter
/// pairs:
///
/// - `{% ... %}` directives (loops, side-effect writes, macro definitions and
///   their closing `END` / `endmacro` markers);
/// - `{{ ... }}` inline escapes (substitutions and `call` macro invocations);
/// - `{# ... #}` comments, which never produce a token.
///
/// Tokens are value types that own their string data. They are produced by
/// the Lexer and consumed by the Parser in a streaming fashion; nothing keeps
/// them after parsing.
///
/// @invariant Each token has a valid TokenKind, SourceLoc and byte offset.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace reltpl::frontends::tpl
{

/// @brief Enumeration of all token kinds produced by the body lexer.
enum class TokenKind
{
    /// @brief End of input; returned forever once reached.
    Eof,

    /// @brief Lexical error; the lexer has already reported a diagnostic.
    Error,

    /// @brief Verbatim run of text between delimiters.
    Literal,

    /// @brief `{% FROM ... %}`, `{% WRITE ... %}`, `{% macro ... %}` or an
    /// unrecognised directive keyword.
    DirectiveOpen,

    /// @brief `{% END %}` or `{% endmacro %}`.
    DirectiveClose,

    /// @brief `{{ call name(args) }}`.
    MacroCallMarker,

    /// @brief Any other `{{ expr }}` escape.
    Substitution,
};

/// @brief Directive keywords recognised after `{%`.
enum class DirectiveKind
{
    Loop,
    Write,
    MacroDef,
    End,
    EndMacro,
    Unknown,
};

/// @brief Lexical token with location and directive payload.
struct Token
{
    TokenKind kind = TokenKind::Eof;

    /// @brief Location of the first delimiter character (or first text byte).
    reltpl::support::SourceLoc loc{};

    /// @brief Byte offset of the token within the template file.
    size_t offset = 0;

    /// @brief Payload text.
    /// @details Literal: the text run. DirectiveOpen/Close: the clause text
    /// after the keyword, trimmed. MacroCallMarker: the text after `call`.
    /// Substitution: the escape content, trimmed.
    std::string text;

    /// @brief Directive keyword as written (DirectiveOpen/Close only).
    std::string keyword;

    /// @brief Classified directive keyword (DirectiveOpen/Close only).
    DirectiveKind directive = DirectiveKind::Unknown;

    /// @brief Trim marker after `{%`; applies to the text before the directive.
    std::optional<unsigned> trimBefore;

    /// @brief Trim marker before `%}`; applies to the text after the directive.
    std::optional<unsigned> trimAfter;

    bool is(TokenKind k) const
    {
        return kind == k;
    }
};

/// @brief Convert a token kind to a human-readable string.
const char *tokenKindToString(TokenKind kind);

/// @brief Spelling used in diagnostics for a directive kind, e.g. "FROM".
const char *directiveKindToString(DirectiveKind kind);

} // namespace reltpl::frontends::tpl
