//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/tpl/test_tpl_schema.cpp
// Purpose: Table catalog scanning of init scripts.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "frontends/tpl/Schema.hpp"

#include <string>
#include <vector>

using reltpl::frontends::tpl::Schema;

TEST(TplSchema, ReadsColumnLists)
{
    auto schema = Schema::fromScript("CREATE TABLE Edge (up TEXT NOT NULL, dn TEXT);\n"
                                     "INSERT INTO Edge VALUES ('a', 'b');");
    ASSERT_TRUE(schema.hasTable("Edge"));
    const auto *cols = schema.columns("Edge");
    ASSERT_NE(cols, nullptr);
    EXPECT_EQ(*cols, (std::vector<std::string>{"up", "dn"}));
    EXPECT_EQ(schema.tableCount(), 1u);
}

TEST(TplSchema, NamesAreCaseInsensitive)
{
    auto schema = Schema::fromScript("create table Page (Slug, Title)");
    EXPECT_TRUE(schema.hasTable("page"));
    EXPECT_TRUE(schema.hasTable("PAGE"));
    EXPECT_TRUE(schema.mayHaveColumn("page", "slug"));
    EXPECT_FALSE(schema.mayHaveColumn("page", "body"));
}

TEST(TplSchema, SkipsTableConstraints)
{
    auto schema = Schema::fromScript(
        "CREATE TABLE t (a INTEGER, b TEXT DEFAULT (lower('X')), "
        "PRIMARY KEY (a), UNIQUE (b), CONSTRAINT c CHECK (a > 0));");
    const auto *cols = schema.columns("t");
    ASSERT_NE(cols, nullptr);
    EXPECT_EQ(*cols, (std::vector<std::string>{"a", "b"}));
}

TEST(TplSchema, QuotedAndQualifiedNames)
{
    auto schema = Schema::fromScript(
        "CREATE TEMP TABLE IF NOT EXISTS main.\"my table\" ([first col], `second`);");
    ASSERT_TRUE(schema.hasTable("my table"));
    ASSERT_TRUE(schema.hasTable("main.my table"));
    EXPECT_TRUE(schema.mayHaveColumn("my table", "first col"));
    EXPECT_TRUE(schema.mayHaveColumn("my table", "second"));
}

TEST(TplSchema, OpaqueTablesAcceptAnyColumn)
{
    auto schema = Schema::fromScript("CREATE TABLE copy AS SELECT * FROM other;\n"
                                     "CREATE VIRTUAL TABLE docs USING fts5(body);\n"
                                     "CREATE VIEW v AS SELECT 1 AS one;");
    EXPECT_TRUE(schema.hasTable("copy"));
    EXPECT_TRUE(schema.hasTable("docs"));
    EXPECT_TRUE(schema.hasTable("v"));
    EXPECT_EQ(schema.columns("docs"), nullptr);
    EXPECT_TRUE(schema.mayHaveColumn("copy", "anything"));
}

TEST(TplSchema, ViewWithColumnList)
{
    auto schema = Schema::fromScript("CREATE VIEW v (x, y) AS SELECT 1, 2;");
    EXPECT_TRUE(schema.mayHaveColumn("v", "x"));
    EXPECT_FALSE(schema.mayHaveColumn("v", "z"));
}

TEST(TplSchema, IgnoresCommentsAndStrings)
{
    auto schema = Schema::fromScript("-- CREATE TABLE fake (a);\n"
                                     "/* CREATE TABLE other (b); */\n"
                                     "INSERT INTO log VALUES ('CREATE TABLE nope (c)');");
    EXPECT_EQ(schema.tableCount(), 0u);
}

TEST(TplSchema, UnknownTablesHaveNoColumns)
{
    Schema schema;
    EXPECT_FALSE(schema.hasTable("t"));
    EXPECT_EQ(schema.columns("t"), nullptr);
    EXPECT_TRUE(schema.mayHaveColumn("t", "c"));

    schema.addTable("sys_Write", {"path", "content"});
    EXPECT_TRUE(schema.hasTable("sys.sys_Write"));
    EXPECT_FALSE(schema.mayHaveColumn("sys_Write", "other"));
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
