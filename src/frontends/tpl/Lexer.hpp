//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.hpp
/// @brief Lexical analyzer for template bodies.
///
/// The lexer walks the code segments of a template in order and splits them
/// into literal text runs and delimiter tokens. It is a single linear scan:
/// no backtracking, and no lookahead beyond the delimiter length except for
/// the trailing trim marker of a directive.
///
/// ## Delimiters
///
/// | Open | Close | Token |
/// |------|-------|-------|
/// | `{%` | `%}`  | DirectiveOpen / DirectiveClose |
/// | `{{` | `}}`  | Substitution / MacroCallMarker |
/// | `{#` | `#}`  | none (comment, may nest) |
///
/// Inside `{% %}` and `{{ }}` single-quoted strings and double-quoted
/// identifiers are skipped, so `SEP '%}'` does not close the directive.
///
/// ## Line escapes
///
/// A line whose first non-blank characters are `%% %%` loses the first
/// `%% `; this is how a body spells a line that would otherwise look like a
/// section separator.
///
/// ## Error Handling
///
/// An unterminated directive, escape or comment is reported with the byte
/// offset of its opening delimiter. After the first error the lexer returns
/// Error and then Eof for every call.
///
/// @invariant pos_ <= current segment size.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/tpl/Sections.hpp"
#include "frontends/tpl/Token.hpp"
#include "support/diagnostics.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reltpl::frontends::tpl
{

/// @brief Lexical analyzer over one or more body segments.
class Lexer
{
  public:
    /// @brief Create a lexer over a single body string starting at offset 0.
    Lexer(std::string source, uint32_t fileId, reltpl::support::DiagnosticEngine &diag);

    /// @brief Create a lexer over the code segments of a template.
    /// @details Segments are lexed back to back; a directive may not span two
    /// segments. The diagnostic engine is borrowed and must outlive the lexer.
    Lexer(std::vector<SourceSegment> segments,
          uint32_t fileId,
          reltpl::support::DiagnosticEngine &diag);

    /// @brief Get the next token, consuming it.
    Token next();

    /// @brief Peek at the next token without consuming it.
    const Token &peek();

    /// @brief True once a lexical error has been reported.
    bool hasError() const
    {
        return hasError_;
    }

  private:
    char peekChar(size_t offset = 0) const;
    char getChar();
    bool atSegmentEnd() const;
    bool startsWith(std::string_view s) const;
    bool atLineStart() const;
    reltpl::support::SourceLoc currentLoc() const;
    size_t currentOffset() const;

    void reportError(reltpl::support::SourceLoc loc,
                     std::string_view code,
                     const std::string &message);

    Token lexToken();
    void lexLiteral(std::string &text);
    bool skipComment();
    Token lexDirective();
    Token lexEscape();

    /// @brief Consume up to @p close, skipping quoted runs.
    /// @return Raw text before the delimiter, or nullopt at segment end.
    std::optional<std::string> scanToClose(std::string_view close);

    std::vector<SourceSegment> segments_;
    size_t segment_ = 0;
    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t column_ = 1;
    uint32_t fileId_;
    reltpl::support::DiagnosticEngine &diag_;
    std::optional<Token> peeked_;
    bool hasError_ = false;
};

} // namespace reltpl::frontends::tpl
