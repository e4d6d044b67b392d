/*
 * pipeline_test.cpp — Rule chaining and per-document pipelines
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "qtprinters.h"
#include "rewrite/delimiterpairrule.h"
#include "rewrite/headerrules.h"
#include "rewrite/pipeline.h"

#include <QStringList>

#include <utility>

using Rewrite::Pipeline;

TEST(Pipeline, EmptyPipelineIsIdentity)
{
    Pipeline pipeline;
    EXPECT_TRUE(pipeline.isEmpty());
    EXPECT_EQ(pipeline.run(QStringLiteral("//x//")), QStringLiteral("//x//"));
}

TEST(Pipeline, RulesRunInInsertionOrder)
{
    Pipeline pipeline;
    pipeline.addRule(new Rewrite::FirstLineHeaderRule);
    pipeline.addRule(new Rewrite::HeaderRule(1));
    EXPECT_EQ(pipeline.ruleCount(), 2);

    // The first-line rule adds "# " before the header rule sees the line,
    // so the header rule no longer matches.
    EXPECT_EQ(pipeline.run(QStringLiteral("=T=")), QStringLiteral("# =T="));
    EXPECT_EQ(pipeline.run(QStringLiteral("=T=")), QStringLiteral("## T"));
}

TEST(Pipeline, OutputOfOneRuleFeedsTheNext)
{
    Pipeline pipeline;
    pipeline.addRule(new Rewrite::ItalicsRule);
    pipeline.addRule(new Rewrite::StrikethroughRule);
    EXPECT_EQ(pipeline.run(QStringLiteral("--//a//--")), QStringLiteral("~~_a_~~"));
}

TEST(Pipeline, JournalConvertsEveryConstruct)
{
    Pipeline pipeline = Pipeline::journal(1);
    EXPECT_EQ(pipeline.ruleCount(), 8);

    EXPECT_EQ(pipeline.run(QStringLiteral("=Plans=")), QStringLiteral("## Plans"));
    EXPECT_EQ(pipeline.run(QStringLiteral("+ read //Dune//")),
              QStringLiteral("1. read _Dune_"));
    EXPECT_EQ(pipeline.run(QStringLiteral("+ --skip-- gym")),
              QStringLiteral("2. ~~skip~~ gym"));
    EXPECT_EQ(pipeline.run(QStringLiteral(R"(see [my_site ""http://ex.com/a_b""] now)")),
              QStringLiteral(R"(see [my_site](http://ex.com/a\_b) now)"));
    EXPECT_EQ(pipeline.run(QStringLiteral(R"([""file:///tmp/a_b"".png])")),
              QStringLiteral("![](file:///tmp/a_b.png)"));
    EXPECT_EQ(pipeline.run(QStringLiteral("run ``make //all//`` in foo_bar")),
              QStringLiteral(R"(run `make //all//` in foo\_bar)"));
}

TEST(Pipeline, JournalLeavesLinksIntact)
{
    Pipeline pipeline = Pipeline::journal();
    const QString line = QStringLiteral("[x](http://a//b--c--d)");
    EXPECT_EQ(pipeline.run(line), line);
}

TEST(Pipeline, DocumentPrefixesFirstLineOnly)
{
    Pipeline pipeline = Pipeline::document();
    const QStringList result = pipeline.runAll({QStringLiteral("Groceries"),
                                                QStringLiteral("+ milk"),
                                                QStringLiteral("+ eggs")});
    EXPECT_EQ(result, (QStringList{QStringLiteral("# Groceries"),
                                   QStringLiteral("1. milk"),
                                   QStringLiteral("2. eggs")}));
}

TEST(Pipeline, SeparatePipelinesDoNotShareState)
{
    Pipeline first = Pipeline::journal();
    first.run(QStringLiteral("+ a"));
    first.run(QStringLiteral("+ b"));

    Pipeline second = Pipeline::journal();
    EXPECT_EQ(second.run(QStringLiteral("+ a")), QStringLiteral("1. a"));
    EXPECT_EQ(first.run(QStringLiteral("+ c")), QStringLiteral("3. c"));
}

TEST(Pipeline, MoveTransfersRules)
{
    Pipeline source = Pipeline::journal();
    source.run(QStringLiteral("+ a"));

    Pipeline target = std::move(source);
    EXPECT_EQ(target.ruleCount(), 8);
    EXPECT_EQ(target.run(QStringLiteral("+ b")), QStringLiteral("2. b"));
}
