//===----------------------------------------------------------------------===//
//
// Part of the reltpl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/tpl/test_tpl_concurrency.cpp
// Purpose: Compilation is deterministic and independent compilations and
//          renders may run on separate threads.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tests/tpl/TplTestUtil.hpp"

#include <algorithm>
#include <string>
#include <thread>
#include <vector>

using reltpl::tests::compileTemplate;
using reltpl::tests::renderTemplate;

namespace
{

constexpr int kThreads = 8;
constexpr int kIterations = 20;

std::string templateFor(int index)
{
    const std::string table = "T" + std::to_string(index);
    return "%% init\nCREATE TABLE " + table + " (v INTEGER);\n"
           "INSERT INTO " + table + " VALUES (1), (2), (" + std::to_string(index) + ");\n"
           "%% code\n"
           "{% macro show(@x) %}<{{ @x }}>{% endmacro %}"
           "{% FROM " + table + " AS A ORDER BY v %}"
           "{% FROM " + table + " AS B WHERE B.v <= A.v ORDER BY v SEP ',' %}"
           "{{ call show(B.v) }}{% END %};{% END %}\n";
}

std::string expectedFor(int index)
{
    std::vector<int> values{1, 2, index};
    std::sort(values.begin(), values.end());
    std::string out;
    for (int a : values)
    {
        std::string row;
        for (int b : values)
        {
            if (b > a)
                continue;
            if (!row.empty())
                row += ",";
            row += "<" + std::to_string(b) + ">";
        }
        out += row + ";";
    }
    return out;
}

} // namespace

TEST(TplConcurrency, CompilationIsDeterministic)
{
    const std::string source = templateFor(5);
    auto first = compileTemplate(source);
    ASSERT_TRUE(first.succeeded());
    for (int i = 0; i < 5; ++i)
    {
        auto again = compileTemplate(source);
        ASSERT_TRUE(again.succeeded());
        EXPECT_EQ(again.query.text, first.query.text);
        EXPECT_EQ(again.query.tables, first.query.tables);
    }
}

TEST(TplConcurrency, ParallelCompilationsMatchSerial)
{
    std::vector<std::string> serial;
    for (int t = 0; t < kThreads; ++t)
        serial.push_back(compileTemplate(templateFor(t)).query.text);

    std::vector<int> mismatches(kThreads, 0);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back([t, &serial, &mismatches]() {
            for (int i = 0; i < kIterations; ++i)
            {
                auto r = compileTemplate(templateFor(t));
                if (!r.succeeded() || r.query.text != serial[t])
                    ++mismatches[t];
            }
        });
    }
    for (auto &th : threads)
        th.join();

    for (int t = 0; t < kThreads; ++t)
        EXPECT_EQ(mismatches[t], 0) << "thread " << t;
}

TEST(TplConcurrency, ParallelRendersAreIndependent)
{
    std::vector<std::string> outputs(kThreads);
    std::vector<std::string> errors(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back([t, &outputs, &errors]() {
            auto r = renderTemplate(templateFor(t));
            if (r.ok)
                outputs[t] = r.output;
            else
                errors[t] = r.code + ": " + r.message;
        });
    }
    for (auto &th : threads)
        th.join();

    for (int t = 0; t < kThreads; ++t)
    {
        EXPECT_TRUE(errors[t].empty()) << errors[t];
        EXPECT_EQ(outputs[t], expectedFor(t)) << "thread " << t;
    }
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
