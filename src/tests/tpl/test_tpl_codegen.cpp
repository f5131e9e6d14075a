//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/tpl/test_tpl_codegen.cpp
// Purpose: Shape of the generated query text and generation-time errors.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "codegen/sql/SqlQuote.hpp"
#include "support/diag_codes.hpp"
#include "tests/tpl/TplTestUtil.hpp"

#include <string>

using namespace reltpl::codegen::sql;
using reltpl::frontends::tpl::CompilerOptions;
using reltpl::tests::compileTemplate;
using reltpl::tests::firstCode;
using reltpl::tests::firstMessage;

namespace
{

size_t countOf(const std::string &haystack, const std::string &needle)
{
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size()))
        ++n;
    return n;
}

} // namespace

TEST(TplQuote, Literals)
{
    EXPECT_EQ(quoteLiteral(""), "''");
    EXPECT_EQ(quoteLiteral("it's"), "'it''s'");
    EXPECT_EQ(quoteLiteral("a\nb"), "'a' || x'0a' || 'b'");
    EXPECT_EQ(quoteLiteral("\r\n"), "'' || x'0d' || x'0a'");
}

TEST(TplQuote, Identifiers)
{
    EXPECT_EQ(quoteIdentifier("up"), "\"up\"");
    EXPECT_EQ(quoteIdentifier("a\"b"), "\"a\"\"b\"");
    EXPECT_EQ(quoteQualifiedName("sys.sys_Write"), "\"sys\".\"sys_Write\"");
    EXPECT_EQ(escapeFormat("100%"), "100%%");
}

TEST(TplCodegen, PlainText)
{
    auto r = compileTemplate("%% code\nhello\n");
    ASSERT_TRUE(r.succeeded()) << firstMessage(r.diagnostics);
    EXPECT_EQ(r.query.text, "SELECT 'hello' AS _pp");
    EXPECT_TRUE(r.query.tables.empty());
    EXPECT_TRUE(r.query.sideEffects.empty());
}

TEST(TplCodegen, EmptyTemplate)
{
    auto r = compileTemplate("");
    ASSERT_TRUE(r.succeeded());
    EXPECT_EQ(r.query.text, "SELECT '' AS _pp");
}

TEST(TplCodegen, NewlinesBecomeBlobLiterals)
{
    auto r = compileTemplate("%% code\na\nb\n%% done\n");
    ASSERT_TRUE(r.succeeded());
    EXPECT_EQ(r.query.text, "SELECT 'a' || x'0a' || 'b' AS _pp");
}

TEST(TplCodegen, LoopShape)
{
    auto r = compileTemplate("%% init\nCREATE TABLE Edge (up TEXT, dn TEXT);\n"
                             "%% code\n{% FROM Edge ORDER BY up DESC %}{{ up }}{% END %}");
    ASSERT_TRUE(r.succeeded()) << firstMessage(r.diagnostics);
    EXPECT_NE(r.query.text.find("coalesce(group_concat(_pp, ''), '')"), std::string::npos);
    EXPECT_NE(r.query.text.find("FROM \"Edge\" AS _1_Edge"), std::string::npos);
    EXPECT_NE(r.query.text.find("ORDER BY _1_Edge.\"up\" DESC"), std::string::npos);
    EXPECT_EQ(r.query.tables.count("Edge"), 1u);
}

TEST(TplCodegen, SeparatorAndWhere)
{
    auto r = compileTemplate("%% code\n{% FROM T WHERE T.n > 1 SEP ', ' %}x{% END %}");
    ASSERT_TRUE(r.succeeded()) << firstMessage(r.diagnostics);
    EXPECT_NE(r.query.text.find("group_concat(_pp, ', ')"), std::string::npos);
    EXPECT_NE(r.query.text.find("WHERE _1_T.\"n\" > 1"), std::string::npos);
}

TEST(TplCodegen, PercentInTextIsEscapedInFormat)
{
    auto r = compileTemplate("%% code\n{% FROM T %}{{ v }}%{% END %}");
    ASSERT_TRUE(r.succeeded()) << firstMessage(r.diagnostics);
    EXPECT_NE(r.query.text.find("printf('%s%%'"), std::string::npos);
}

TEST(TplCodegen, WriteBecomesSideEffect)
{
    auto r = compileTemplate("%% code\n{% WRITE 'out/' || name || '.txt' FROM Page %}"
                             "{{ body }}{% END %}rest");
    ASSERT_TRUE(r.succeeded()) << firstMessage(r.diagnostics);
    ASSERT_EQ(r.query.sideEffects.size(), 1u);
    const auto &stmt = r.query.sideEffects.front();
    EXPECT_EQ(stmt.rfind("INSERT INTO \"sys_Write\" (path, content)", 0), 0u);
    EXPECT_NE(stmt.find("FROM \"Page\" AS _1_Page"), std::string::npos);
    EXPECT_EQ(r.query.text, "SELECT 'rest' AS _pp");
}

TEST(TplCodegen, WideSequencesSplitIntoNestedCalls)
{
    CompilerOptions opts;
    opts.maxFunctionArgs = 4;
    auto r = compileTemplate("%% code\n{% FROM T %}{{ a }}{{ b }}{{ c }}{{ d }}{{ e }}{{ f }}{% END %}",
                             opts);
    ASSERT_TRUE(r.succeeded()) << firstMessage(r.diagnostics);
    EXPECT_GT(countOf(r.query.text, "printf("), 1u);
}

TEST(TplCodegen, FieldOutsideLoop)
{
    auto r = compileTemplate("%% code\n{{ x }}");
    EXPECT_FALSE(r.succeeded());
    EXPECT_EQ(firstCode(r.diagnostics), reltpl::diag::FieldOutsideLoop);
    EXPECT_EQ(firstMessage(r.diagnostics), "field reference 'x' outside of any loop");
}

TEST(TplCodegen, UnknownRowSource)
{
    auto r = compileTemplate("%% code\n{% FROM T %}{{ Other.x }}{% END %}");
    EXPECT_FALSE(r.succeeded());
    EXPECT_EQ(firstCode(r.diagnostics), reltpl::diag::UnknownRowSource);
}

TEST(TplCodegen, StrictRowReferenceInSql)
{
    auto r = compileTemplate("%% code\n{% FROM T WHERE $Nope.x = 1 %}{% END %}");
    EXPECT_FALSE(r.succeeded());
    EXPECT_EQ(firstCode(r.diagnostics), reltpl::diag::UnknownRowSource);
}

TEST(TplCodegen, UnknownOrderColumn)
{
    auto r = compileTemplate("%% init\nCREATE TABLE T (a);\n"
                             "%% code\n{% FROM T ORDER BY b %}{% END %}");
    EXPECT_FALSE(r.succeeded());
    EXPECT_EQ(firstCode(r.diagnostics), reltpl::diag::UnknownOrderColumn);
}

TEST(TplCodegen, UnknownColumn)
{
    auto r = compileTemplate("%% init\nCREATE TABLE T (a);\n"
                             "%% code\n{% FROM T %}{{ b }}{% END %}");
    EXPECT_FALSE(r.succeeded());
    EXPECT_EQ(firstCode(r.diagnostics), reltpl::diag::UnknownColumn);
    EXPECT_EQ(firstMessage(r.diagnostics), "table 'T' has no column 'b'");
}

TEST(TplCodegen, UndeclaredTable)
{
    CompilerOptions opts;
    opts.requireDeclaredTables = true;
    auto r = compileTemplate("%% code\n{% FROM Missing %}{% END %}", opts);
    EXPECT_FALSE(r.succeeded());
    EXPECT_EQ(firstCode(r.diagnostics), reltpl::diag::UnknownTable);

    // The side-effect table is always known.
    auto w = compileTemplate("%% code\n{% FROM sys_Write %}{{ path }}{% END %}", opts);
    EXPECT_TRUE(w.succeeded()) << firstMessage(w.diagnostics);
}

TEST(TplCodegen, NestingLimit)
{
    CompilerOptions opts;
    opts.maxNestingDepth = 1;
    auto r = compileTemplate("%% code\n{% FROM A %}{% FROM B %}{% END %}{% END %}", opts);
    EXPECT_FALSE(r.succeeded());
    EXPECT_EQ(firstCode(r.diagnostics), reltpl::diag::NestingTooDeep);
}

TEST(TplCodegen, NestingDepthRestoredAfterSiblings)
{
    CompilerOptions opts;
    opts.maxNestingDepth = 1;
    auto r = compileTemplate("%% code\n{% macro m() %}m{% endmacro %}"
                             "{% FROM A %}a{% END %}{% FROM B %}b{% END %}"
                             "{{ call m() }}{{ call m() }}{% FROM C %}c{% END %}",
                             opts);
    EXPECT_TRUE(r.succeeded()) << firstMessage(r.diagnostics);
}

TEST(TplCodegen, NestingLimitCoversMacroExpansion)
{
    // Each loop is shallow on its own; expanding the macros nests them.
    CompilerOptions opts;
    opts.maxNestingDepth = 2;
    auto r = compileTemplate("%% code\n{% macro inner() %}{% FROM B %}b{% END %}{% endmacro %}"
                             "{% FROM A %}{{ call inner() }}{% END %}",
                             opts);
    EXPECT_FALSE(r.succeeded());
    EXPECT_EQ(firstCode(r.diagnostics), reltpl::diag::NestingTooDeep);
}

TEST(TplCodegen, VeryDeepTemplateReportsNestingError)
{
    std::string source = "%% code\n";
    for (int i = 0; i < 100000; ++i)
        source += "{% FROM T %}";
    source += "x";
    for (int i = 0; i < 100000; ++i)
        source += "{% END %}";
    auto r = compileTemplate(source);
    EXPECT_FALSE(r.succeeded());
    EXPECT_EQ(r.diagnostics.errorCount(), 1u);
    EXPECT_EQ(firstCode(r.diagnostics), reltpl::diag::NestingTooDeep);
    EXPECT_TRUE(r.query.text.empty());
}

TEST(TplCodegen, MacroExpansionBindsArguments)
{
    auto r = compileTemplate("%% code\n{% macro wrap(@v) %}[{{ @v }}]{% endmacro %}"
                             "{% FROM T %}{{ call wrap(name) }}{% END %}");
    ASSERT_TRUE(r.succeeded()) << firstMessage(r.diagnostics);
    EXPECT_NE(r.query.text.find("printf('[%s]'"), std::string::npos);
    EXPECT_NE(r.query.text.find("_1_T.\"name\""), std::string::npos);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
