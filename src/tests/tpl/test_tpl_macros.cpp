//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/tpl/test_tpl_macros.cpp
// Purpose: Macro table construction: hoisting, resolution and cycle checks.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "frontends/tpl/MacroTable.hpp"
#include "support/diag_codes.hpp"
#include "tests/tpl/TplTestUtil.hpp"

#include <optional>
#include <string>

using namespace reltpl::frontends::tpl;
using reltpl::tests::firstCode;
using reltpl::tests::firstMessage;
using reltpl::tests::parseBody;

namespace
{

/// @brief Parse @p body and build its macro table into @p p.
std::optional<MacroTable> buildTable(reltpl::tests::ParsedBody &p)
{
    EXPECT_NE(p.root, nullptr) << firstMessage(p.diag);
    if (!p.root)
        return std::nullopt;
    return MacroTable::build(*p.root, p.diag);
}

} // namespace

TEST(TplMacros, DefinitionsAreHoisted)
{
    auto p = parseBody("a{% macro m() %}x{% endmacro %}b{{ call m() }}");
    auto table = buildTable(*p);
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table->size(), 1u);
    ASSERT_NE(table->find("m"), nullptr);
    EXPECT_EQ(table->find("zz"), nullptr);

    // The text around the definition joins into one run.
    ASSERT_EQ(p->root->children.size(), 2u);
    ASSERT_EQ(p->root->children[0]->kind, NodeKind::Text);
    EXPECT_EQ(static_cast<const TextNode &>(*p->root->children[0]).text, "ab");
    EXPECT_EQ(p->root->children[1]->kind, NodeKind::MacroCall);
}

TEST(TplMacros, DefinitionsKeepSourceOrder)
{
    auto p = parseBody("{% macro b() %}{% endmacro %}{% macro a() %}{% endmacro %}");
    auto table = buildTable(*p);
    ASSERT_TRUE(table.has_value());
    ASSERT_EQ(table->definitions().size(), 2u);
    EXPECT_EQ(table->definitions()[0]->name, "b");
    EXPECT_EQ(table->definitions()[1]->name, "a");
}

TEST(TplMacros, CallsBetweenMacrosResolve)
{
    auto p = parseBody("{% macro inner(@v) %}[{{ @v }}]{% endmacro %}"
                       "{% macro outer(@v) %}{{ call inner(@v) }}{% endmacro %}"
                       "{{ call outer('x') }}");
    auto table = buildTable(*p);
    ASSERT_TRUE(table.has_value()) << firstMessage(p->diag);
    EXPECT_EQ(p->diag.errorCount(), 0u);
}

TEST(TplMacros, CallBeforeDefinitionResolves)
{
    auto p = parseBody("{{ call later() }}{% macro later() %}ok{% endmacro %}");
    auto table = buildTable(*p);
    EXPECT_TRUE(table.has_value());
}

TEST(TplMacros, Redefinition)
{
    auto p = parseBody("{% macro m() %}{% endmacro %}\n{% macro m() %}{% endmacro %}");
    auto table = buildTable(*p);
    EXPECT_FALSE(table.has_value());
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::MacroRedefined);
    EXPECT_EQ(firstMessage(p->diag), "macro 'm' redefined (first defined at line 1)");
}

TEST(TplMacros, DuplicateParameter)
{
    auto p = parseBody("{% macro m(@a, @a) %}{% endmacro %}");
    auto table = buildTable(*p);
    EXPECT_FALSE(table.has_value());
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::DuplicateParameter);
}

TEST(TplMacros, UndefinedMacro)
{
    auto p = parseBody("{{ call nope() }}");
    auto table = buildTable(*p);
    EXPECT_FALSE(table.has_value());
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::UnknownMacro);
    EXPECT_EQ(firstMessage(p->diag), "call to undefined macro 'nope'");
}

TEST(TplMacros, UndefinedMacroInsideLoop)
{
    auto p = parseBody("{% FROM T %}{{ call nope() }}{% END %}");
    auto table = buildTable(*p);
    EXPECT_FALSE(table.has_value());
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::UnknownMacro);
}

TEST(TplMacros, ArgumentCount)
{
    auto p = parseBody("{% macro m(@a, @b) %}{% endmacro %}{{ call m('x') }}");
    auto table = buildTable(*p);
    EXPECT_FALSE(table.has_value());
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::ArgumentCountMismatch);
    EXPECT_EQ(firstMessage(p->diag), "macro 'm' expects 2 argument(s), got 1");
}

TEST(TplMacros, ParameterOutsideMacro)
{
    auto p = parseBody("{{ @p }}");
    auto table = buildTable(*p);
    EXPECT_FALSE(table.has_value());
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::UnknownParameter);
    EXPECT_EQ(firstMessage(p->diag), "parameter '@p' used outside of a macro");
}

TEST(TplMacros, UnknownParameterInSql)
{
    auto p = parseBody("{% macro m(@a) %}{{ @a || @q }}{% endmacro %}");
    auto table = buildTable(*p);
    EXPECT_FALSE(table.has_value());
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::UnknownParameter);
    EXPECT_EQ(firstMessage(p->diag), "unknown parameter '@q' in macro 'm'");
}

TEST(TplMacros, DirectRecursion)
{
    auto p = parseBody("{% macro a() %}{{ call a() }}{% endmacro %}");
    auto table = buildTable(*p);
    EXPECT_FALSE(table.has_value());
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::RecursiveMacro);
    EXPECT_EQ(firstMessage(p->diag), "recursive macro: a -> a");
}

TEST(TplMacros, IndirectRecursion)
{
    auto p = parseBody("{% macro a() %}{{ call b() }}{% endmacro %}"
                       "{% macro b() %}{% FROM T %}{{ call a() }}{% END %}{% endmacro %}");
    auto table = buildTable(*p);
    EXPECT_FALSE(table.has_value());
    EXPECT_EQ(firstCode(p->diag), reltpl::diag::RecursiveMacro);
    EXPECT_EQ(firstMessage(p->diag), "recursive macro: a -> b -> a");
}

TEST(TplMacros, RecursiveTemplateNeverReachesGeneration)
{
    auto result = reltpl::tests::compileTemplate(
        "%% code\n{% macro a() %}{{ call b() }}{% endmacro %}"
        "{% macro b() %}{{ call a() }}{% endmacro %}{{ call a() }}");
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.diagnostics.errorCount(), 1u);
    EXPECT_EQ(firstCode(result.diagnostics), reltpl::diag::RecursiveMacro);
    EXPECT_TRUE(result.query.text.empty());
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
