//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/tpl/Parser.hpp
// Purpose: Builds the template AST from the token stream.
// Key invariants: Open constructs live on an explicit stack, never on the C++
//                 call stack; parsing stops at the first structural error.
// Ownership/Lifetime: Parser borrows Lexer and DiagnosticEngine.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/tpl/AST.hpp"
#include "frontends/tpl/Lexer.hpp"
#include "frontends/tpl/Options.hpp"
#include "support/diagnostics.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reltpl::frontends::tpl
{

/// @brief Default whitespace trim amounts applied next to directives.
/// @details 0 keeps everything, 1 trims blanks to the line edge, 2 also
/// trims one line break, 3 trims all whitespace.
struct TrimDefaults
{
    unsigned blockOpenBefore = 1;
    unsigned blockOpenAfter = 2;
    unsigned blockEndBefore = 1;
    unsigned blockEndAfter = 2;
    unsigned macroOpenBefore = 1;
    unsigned macroOpenAfter = 2;
    unsigned macroEndBefore = 2;
    unsigned macroEndAfter = 2;
};

/// @brief Apply a trim amount to the start of @p text.
void trimLeft(std::string &text, unsigned amount);

/// @brief Apply a trim amount to the end of @p text.
void trimRight(std::string &text, unsigned amount);

class Parser
{
  public:
    Parser(Lexer &lexer, reltpl::support::DiagnosticEngine &diag);

    /// @brief Parse the whole body.
    /// @return Root sequence, or nullptr after the first error.
    std::unique_ptr<SequenceNode> parseTemplate();

    bool hasError() const
    {
        return hasError_;
    }

    /// @brief Deepest loop nesting accepted before NestingTooDeep.
    void setMaxNestingDepth(unsigned depth)
    {
        maxNesting_ = depth;
    }

    //=========================================================================
    // Clause parsing; public so the clause grammar can be tested directly.
    //=========================================================================

    /// @brief Parse the text after `FROM` (or after `WRITE path FROM`).
    /// @param separator Receives the SEP string; null when SEP is not allowed.
    std::optional<RowSource> parseRowSource(std::string_view text,
                                            SourceLoc loc,
                                            std::string *separator);

    /// @brief Parse an inline value: field, parameter, literal or SQL.
    NodePtr parseValue(std::string_view text, SourceLoc loc);

    /// @brief Parse `name(arg, ...)` after `call`.
    std::unique_ptr<MacroCallNode> parseMacroCall(std::string_view text, SourceLoc loc);

    /// @brief Split raw SQL into verbatim text, row references and parameters.
    std::optional<SqlFragments> parseSql(std::string_view text, SourceLoc loc);

    /// @brief Decode a single-quoted SEP string.
    std::optional<std::string> parseSeparator(std::string_view quoted, SourceLoc loc);

  private:
    struct OpenConstruct
    {
        DirectiveKind directive;
        Node *node;
        SequenceNode *body;
        SourceLoc loc;
    };

    void error(SourceLoc loc, std::string_view code, const std::string &message);

    SequenceNode &current();
    void appendText(std::string text, SourceLoc loc);
    void appendNode(NodePtr node);
    void trimPrecedingText(unsigned amount);

    unsigned openLoopDepth() const;
    void handleOpen(Token &tok);
    void handleClose(Token &tok);

    std::unique_ptr<MacroDefNode> parseMacroHeader(std::string_view text, SourceLoc loc);
    std::unique_ptr<WriteNode> parseWriteHeader(std::string_view text, SourceLoc loc);

    Lexer &lexer_;
    reltpl::support::DiagnosticEngine &diag_;
    TrimDefaults trims_;
    unsigned maxNesting_ = CompilerOptions{}.maxNestingDepth;
    std::unique_ptr<SequenceNode> root_;
    std::vector<OpenConstruct> stack_;
    std::optional<unsigned> pendingTrim_;
    /// Last text node built from template text; substitution literals are
    /// never merged into it.
    TextNode *templateText_ = nullptr;
    bool hasError_ = false;
};

} // namespace reltpl::frontends::tpl
