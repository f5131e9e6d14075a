//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/tpl/test_tpl_parser.cpp
// Purpose: Template structure, clause grammar, whitespace trimming and parse
//          errors.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "frontends/tpl/AstPrinter.hpp"
#include "support/diag_codes.hpp"
#include "tests/tpl/TplTestUtil.hpp"

#include <memory>
#include <string>

using namespace reltpl::frontends::tpl;
using reltpl::tests::firstCode;
using reltpl::tests::firstMessage;
using reltpl::tests::parseBody;

namespace
{

const TextNode &asText(const NodePtr &node)
{
    EXPECT_EQ(node->kind, NodeKind::Text);
    return static_cast<const TextNode &>(*node);
}

const LoopNode &asLoop(const NodePtr &node)
{
    EXPECT_EQ(node->kind, NodeKind::Loop);
    return static_cast<const LoopNode &>(*node);
}

} // namespace

//===----------------------------------------------------------------------===//
// Structure
//===----------------------------------------------------------------------===//

TEST(TplParser, LoopBetweenText)
{
    auto p = parseBody("a{% FROM Edge %}b{% END %}c");
    ASSERT_NE(p->root, nullptr);
    ASSERT_EQ(p->root->children.size(), 3u);
    EXPECT_EQ(asText(p->root->children[0]).text, "a");
    const auto &loop = asLoop(p->root->children[1]);
    EXPECT_EQ(loop.source.table, "Edge");
    EXPECT_EQ(loop.source.name, "Edge");
    ASSERT_EQ(loop.body->children.size(), 1u);
    EXPECT_EQ(asText(loop.body->children[0]).text, "b");
    EXPECT_EQ(asText(p->root->children[2]).text, "c");
}

TEST(TplParser, SubstitutionForms)
{
    auto p = parseBody("{{ up }}{{ Edge.dn }}{{ $E.dn }}{{ @p }}{{ 'it''s' }}{{ 42 }}{{ up || dn }}");
    ASSERT_NE(p->root, nullptr);
    const auto &c = p->root->children;
    ASSERT_EQ(c.size(), 7u);

    ASSERT_EQ(c[0]->kind, NodeKind::FieldRef);
    EXPECT_EQ(static_cast<const FieldRefNode &>(*c[0]).source, "");
    EXPECT_EQ(static_cast<const FieldRefNode &>(*c[0]).column, "up");

    ASSERT_EQ(c[1]->kind, NodeKind::FieldRef);
    EXPECT_EQ(static_cast<const FieldRefNode &>(*c[1]).source, "Edge");

    ASSERT_EQ(c[2]->kind, NodeKind::FieldRef);
    EXPECT_EQ(static_cast<const FieldRefNode &>(*c[2]).source, "E");

    ASSERT_EQ(c[3]->kind, NodeKind::ParamRef);
    EXPECT_EQ(static_cast<const ParamRefNode &>(*c[3]).name, "p");

    EXPECT_EQ(asText(c[4]).text, "it's");
    ASSERT_EQ(c[5]->kind, NodeKind::SqlExpr);

    ASSERT_EQ(c[6]->kind, NodeKind::SqlExpr);
}

TEST(TplParser, RowSourceClauses)
{
    auto p = parseBody("{% FROM main.Edge AS $E WHERE E.up <> 'x' ORDER BY dn DESC SEP ', ' %}{% END %}");
    ASSERT_NE(p->root, nullptr);
    const auto &loop = asLoop(p->root->children[0]);
    EXPECT_EQ(loop.source.table, "main.Edge");
    EXPECT_EQ(loop.source.name, "E");
    ASSERT_TRUE(loop.source.orderBy.has_value());
    EXPECT_EQ(*loop.source.orderBy, "dn");
    EXPECT_EQ(loop.source.direction, SortDirection::Descending);
    EXPECT_EQ(loop.separator, ", ");
    ASSERT_FALSE(loop.source.where.empty());
    EXPECT_EQ(loop.source.where[0].kind, SqlFragment::Kind::RowField);
    EXPECT_EQ(loop.source.where[0].name, "E");
    EXPECT_EQ(loop.source.where[0].column, "up");
}

TEST(TplParser, SubquerySource)
{
    auto p = parseBody("{% FROM (SELECT 1 AS n) AS One %}{{ n }}{% END %}");
    ASSERT_NE(p->root, nullptr);
    const auto &loop = asLoop(p->root->children[0]);
    ASSERT_TRUE(loop.source.subquery.has_value());
    EXPECT_TRUE(loop.source.table.empty());
    EXPECT_EQ(loop.source.name, "One");
}

TEST(TplParser, WriteHeader)
{
    auto p = parseBody("{% WRITE 'out/' || slug FROM Page ORDER BY slug %}x{% END %}");
    ASSERT_NE(p->root, nullptr);
    ASSERT_EQ(p->root->children[0]->kind, NodeKind::Write);
    const auto &write = static_cast<const WriteNode &>(*p->root->children[0]);
    ASSERT_TRUE(write.source.has_value());
    EXPECT_EQ(write.source->table, "Page");
    EXPECT_FALSE(write.path.empty());
}

TEST(TplParser, MacroDefinitionAndCall)
{
    auto p = parseBody("{% macro edge(@a, @b) %}{{ @a }}->{{ @b }}{% endmacro %}"
                       "{{ call edge('x', up) }}");
    ASSERT_NE(p->root, nullptr);
    ASSERT_EQ(p->root->children.size(), 2u);
    ASSERT_EQ(p->root->children[0]->kind, NodeKind::MacroDef);
    const auto &def = static_cast<const MacroDefNode &>(*p->root->children[0]);
    EXPECT_EQ(def.name, "edge");
    ASSERT_EQ(def.params.size(), 2u);
    EXPECT_EQ(def.params[1], "b");

    ASSERT_EQ(p->root->children[1]->kind, NodeKind::MacroCall);
    const auto &call = static_cast<const MacroCallNode &>(*p->root->children[1]);
    ASSERT_EQ(call.args.size(), 2u);
    EXPECT_EQ(call.args[0]->kind, NodeKind::Text);
    EXPECT_EQ(call.args[1]->kind, NodeKind::FieldRef);
}

TEST(TplParser, CommentsDoNotSplitText)
{
    auto p = parseBody("a{# note #}b");
    ASSERT_NE(p->root, nullptr);
    ASSERT_EQ(p->root->children.size(), 1u);
    EXPECT_EQ(asText(p->root->children[0]).text, "ab");
}

TEST(TplParser, DumpShowsStructure)
{
    auto p = parseBody("{% FROM Edge ORDER BY up DESC %}{{ up }}{% END %}");
    ASSERT_NE(p->root, nullptr);
    AstPrinter printer;
    std::string dump = printer.dump(*p->root);
    EXPECT_NE(dump.find("Loop Edge AS Edge ORDER BY up DESC SEP \"\""), std::string::npos);
    EXPECT_NE(dump.find("    FieldRef <innermost>.up"), std::string::npos);
}

//===----------------------------------------------------------------------===//
// Whitespace trimming
//===----------------------------------------------------------------------===//

TEST(TplTrim, StandaloneDirectiveLinesVanish)
{
    auto p = parseBody("a\n  {% FROM T %}\n  b\n  {% END %}\nc");
    ASSERT_NE(p->root, nullptr);
    ASSERT_EQ(p->root->children.size(), 3u);
    EXPECT_EQ(asText(p->root->children[0]).text, "a\n");
    EXPECT_EQ(asText(asLoop(p->root->children[1]).body->children[0]).text, "  b\n");
    EXPECT_EQ(asText(p->root->children[2]).text, "c");
}

TEST(TplTrim, DashTrimsBlanksOnly)
{
    auto p = parseBody("x  {%- FROM T -%}  y  {%- END -%}  z");
    ASSERT_NE(p->root, nullptr);
    EXPECT_EQ(asText(p->root->children[0]).text, "x");
    EXPECT_EQ(asText(asLoop(p->root->children[1]).body->children[0]).text, "y");
    EXPECT_EQ(asText(p->root->children[2]).text, "z");
}

TEST(TplTrim, PlusKeepsEverything)
{
    auto p = parseBody("a\n{%+ FROM T +%}\nb\n{% END %}");
    ASSERT_NE(p->root, nullptr);
    EXPECT_EQ(asText(p->root->children[0]).text, "a\n");
    EXPECT_EQ(asText(asLoop(p->root->children[1]).body->children[0]).text, "\nb\n");
}

TEST(TplTrim, TripleDashTrimsAllWhitespace)
{
    auto p = parseBody("a \n\n {%--- FROM T ---%} \n\n b{% END %}");
    ASSERT_NE(p->root, nullptr);
    EXPECT_EQ(asText(p->root->children[0]).text, "a");
    EXPECT_EQ(asText(asLoop(p->root->children[1]).body->children[0]).text, "b");
}

TEST(TplTrim, SubstitutionsNeverTrim)
{
    auto p = parseBody("a {{ ' ' }}{% FROM T %}{% END %} c");
    ASSERT_NE(p->root, nullptr);
    ASSERT_EQ(p->root->children.size(), 4u);
    EXPECT_EQ(asText(p->root->children[0]).text, "a ");
    EXPECT_EQ(asText(p->root->children[1]).text, " ");
    EXPECT_EQ(asText(p->root->children[3]).text, "c");
}

TEST(TplTrim, TrimFunctions)
{
    std::string s = "  \n\n x";
    trimLeft(s, 1);
    EXPECT_EQ(s, "\n\n x");
    s = "  \r\n\n x";
    trimLeft(s, 2);
    EXPECT_EQ(s, "\n x");
    s = "x \n \t";
    trimRight(s, 1);
    EXPECT_EQ(s, "x \n");
    s = "x \n \t";
    trimRight(s, 2);
    EXPECT_EQ(s, "x ");
    s = "x \n \t";
    trimRight(s, 3);
    EXPECT_EQ(s, "x");
    s = " x ";
    trimLeft(s, 0);
    EXPECT_EQ(s, " x ");
}

//===----------------------------------------------------------------------===//
// Errors
//===----------------------------------------------------------------------===//

TEST(TplParserErrors, MismatchedClose)
{
    auto p = parseBody("{% macro m() %}x{% END %}");
    EXPECT_EQ(p->root, nullptr);
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::MismatchedClose);
    EXPECT_EQ(firstMessage(p->diag),
              "mismatched 'END': expected 'endmacro' to close 'macro' opened at line 1");
}

TEST(TplParserErrors, EndMacroClosingLoop)
{
    auto p = parseBody("{% FROM T %}\n{% endmacro %}");
    EXPECT_EQ(p->root, nullptr);
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::MismatchedClose);
}

TEST(TplParserErrors, UnclosedConstruct)
{
    auto p = parseBody("x\n{% FROM T %}y");
    EXPECT_EQ(p->root, nullptr);
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::UnclosedConstruct);
    EXPECT_EQ(firstMessage(p->diag), "unclosed 'FROM' opened at line 2 (expected 'END')");
}

TEST(TplParserErrors, CloseWithoutOpen)
{
    auto p = parseBody("x{% END %}");
    EXPECT_EQ(p->root, nullptr);
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::UnexpectedClose);
    EXPECT_EQ(firstMessage(p->diag), "'END' without an open directive");
}

TEST(TplParserErrors, MacroInsideLoop)
{
    auto p = parseBody("{% FROM T %}{% macro m() %}{% endmacro %}{% END %}");
    EXPECT_EQ(p->root, nullptr);
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::MacroNotTopLevel);
}

TEST(TplParserErrors, WriteInsideLoop)
{
    auto p = parseBody("{% FROM T %}{% WRITE 'a' %}{% END %}{% END %}");
    EXPECT_EQ(p->root, nullptr);
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::WriteNotTopLevel);
}

TEST(TplParserErrors, UnknownDirective)
{
    auto p = parseBody("{% IF x %}");
    EXPECT_EQ(p->root, nullptr);
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::UnknownDirective);
    EXPECT_EQ(firstMessage(p->diag), "unknown directive 'IF'");
}

TEST(TplParserErrors, ClauseOrder)
{
    auto p = parseBody("{% FROM T SEP ',' WHERE a = 1 %}{% END %}");
    EXPECT_EQ(p->root, nullptr);
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::MalformedClause);
}

TEST(TplParser, ColumnsNamedLikeKeywords)
{
    auto p = parseBody("{% FROM T WHERE sep = 1 AND \"order\" > 2 ORDER BY sep DESC SEP '; ' %}{% END %}");
    ASSERT_NE(p->root, nullptr) << firstMessage(p->diag);
    const auto &loop = asLoop(p->root->children[0]);
    ASSERT_EQ(loop.source.where.size(), 1u);
    EXPECT_EQ(loop.source.where[0].text, "sep = 1 AND \"order\" > 2");
    ASSERT_TRUE(loop.source.orderBy.has_value());
    EXPECT_EQ(*loop.source.orderBy, "sep");
    EXPECT_EQ(loop.source.direction, SortDirection::Descending);
    EXPECT_EQ(loop.separator, "; ");

    auto bare = parseBody("{% FROM T WHERE sep %}{% END %}");
    ASSERT_NE(bare->root, nullptr) << firstMessage(bare->diag);
    EXPECT_EQ(asLoop(bare->root->children[0]).source.where[0].text, "sep");
}

TEST(TplParserErrors, SubqueryNeedsAlias)
{
    auto p = parseBody("{% FROM (SELECT 1) %}{% END %}");
    EXPECT_EQ(p->root, nullptr);
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::MalformedClause);
}

TEST(TplParserErrors, BadOrderDirection)
{
    auto p = parseBody("{% FROM T ORDER BY a SIDEWAYS %}{% END %}");
    EXPECT_EQ(p->root, nullptr);
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::MalformedClause);
}

TEST(TplParserErrors, SepNotAllowedOnWrite)
{
    auto p = parseBody("{% WRITE 'a' FROM T SEP ',' %}{% END %}");
    EXPECT_EQ(p->root, nullptr);
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::MalformedClause);
}

TEST(TplParserErrors, MacroParamsNeedAt)
{
    auto p = parseBody("{% macro m(a) %}{% endmacro %}");
    EXPECT_EQ(p->root, nullptr);
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::MalformedClause);
}

TEST(TplParserErrors, EmptySubstitution)
{
    auto p = parseBody("{{   }}");
    EXPECT_EQ(p->root, nullptr);
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::InvalidSubstitution);
}

TEST(TplParserErrors, CallWithoutParens)
{
    auto p = parseBody("{{ call m }}");
    EXPECT_EQ(p->root, nullptr);
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::InvalidSubstitution);
}

TEST(TplParserErrors, LexErrorStopsParsing)
{
    auto p = parseBody("{% FROM T %}{{ x");
    EXPECT_EQ(p->root, nullptr);
    ASSERT_EQ(p->diag.errorCount(), 1u);
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::UnterminatedSubstitution);
}

namespace
{

std::string nestedLoops(size_t depth, bool closed)
{
    std::string body;
    body.reserve(depth * 24);
    for (size_t i = 0; i < depth; ++i)
        body += "{% FROM T %}";
    body += "x";
    if (closed)
    {
        for (size_t i = 0; i < depth; ++i)
            body += "{% END %}";
    }
    return body;
}

} // namespace

TEST(TplParserErrors, NestingLimitStopsDeepTemplates)
{
    for (bool closed : {true, false})
    {
        auto p = parseBody(nestedLoops(200000, closed));
        EXPECT_EQ(p->root, nullptr);
        ASSERT_EQ(p->diag.errorCount(), 1u);
        EXPECT_EQ(firstCode(p->diag), reltpl::diag::NestingTooDeep);
        EXPECT_EQ(firstMessage(p->diag),
                  "loops and macro expansions nested too deeply (limit: 1000)");
        EXPECT_EQ(p->diag.firstError()->loc.column, 1u + 1000u * 12u);
    }
}

TEST(TplParserErrors, NestingLimitCountsLoopsOnly)
{
    auto atLimit = parseBody(nestedLoops(1000, true));
    EXPECT_NE(atLimit->root, nullptr) << firstMessage(atLimit->diag);

    // The enclosing macro definition is not a nesting level.
    auto inMacro = parseBody("{% macro m() %}" + nestedLoops(1000, true) + "{% endmacro %}");
    EXPECT_NE(inMacro->root, nullptr) << firstMessage(inMacro->diag);

    auto over = parseBody(nestedLoops(1001, true));
    EXPECT_EQ(over->root, nullptr);
    EXPECT_EQ(firstCode(over->diag), reltpl::diag::NestingTooDeep);
}

TEST(TplAst, DeepTreeTearsDownIteratively)
{
    auto root = std::make_unique<SequenceNode>(SourceLoc{});
    SequenceNode *body = root.get();
    for (int i = 0; i < 500000; ++i)
    {
        auto loop = std::make_unique<LoopNode>(SourceLoc{});
        loop->body = std::make_unique<SequenceNode>(SourceLoc{});
        SequenceNode *next = loop->body.get();
        body->children.push_back(std::make_unique<TextNode>(SourceLoc{}, "x"));
        body->children.push_back(std::move(loop));
        body = next;
    }
    root.reset();
    EXPECT_EQ(root, nullptr);
}

//===----------------------------------------------------------------------===//
// SEP strings
//===----------------------------------------------------------------------===//

TEST(TplSeparator, Escapes)
{
    reltpl::support::DiagnosticEngine diag;
    Lexer lexer(std::string(), 1, diag);
    Parser parser(lexer, diag);
    auto sep = parser.parseSeparator("'a''b\\n\\\\'", {});
    ASSERT_TRUE(sep.has_value());
    EXPECT_EQ(*sep, "a'b\n\\");
    EXPECT_EQ(diag.errorCount(), 0u);
}

TEST(TplSeparator, RejectsUnknownEscape)
{
    reltpl::support::DiagnosticEngine diag;
    Lexer lexer(std::string(), 1, diag);
    Parser parser(lexer, diag);
    EXPECT_FALSE(parser.parseSeparator("'\\t'", {}).has_value());
    EXPECT_EQ(firstCode(diag), reltpl::diag::InvalidSeparator);
}

TEST(TplSeparator, RejectsUnquoted)
{
    reltpl::support::DiagnosticEngine diag;
    Lexer lexer(std::string(), 1, diag);
    Parser parser(lexer, diag);
    EXPECT_FALSE(parser.parseSeparator(",", {}).has_value());
    EXPECT_EQ(firstCode(diag), reltpl::diag::InvalidSeparator);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
