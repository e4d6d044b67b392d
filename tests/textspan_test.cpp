/*
 * textspan_test.cpp — Span intersection and whole-line spans
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "qtprinters.h"
#include "rewrite/textspan.h"

using Rewrite::TextSpan;

TEST(TextSpan, OverlappingSpansIntersect)
{
    EXPECT_TRUE(Rewrite::intersects({0, 5}, {3, 8}));
    EXPECT_TRUE(Rewrite::intersects({3, 8}, {0, 5}));
    EXPECT_TRUE(Rewrite::intersects({0, 10}, {2, 4}));
}

TEST(TextSpan, TouchingSpansIntersect)
{
    EXPECT_TRUE(Rewrite::intersects({0, 2}, {2, 4}));
    EXPECT_TRUE(Rewrite::intersects({2, 4}, {0, 2}));
    // Zero-width spans on a boundary still count.
    EXPECT_TRUE(Rewrite::intersects({4, 4}, {0, 4}));
    EXPECT_TRUE(Rewrite::intersects({0, 0}, {0, 3}));
}

TEST(TextSpan, DisjointSpansDoNotIntersect)
{
    EXPECT_FALSE(Rewrite::intersects({0, 2}, {3, 5}));
    EXPECT_FALSE(Rewrite::intersects({6, 9}, {0, 5}));
}

TEST(TextSpan, WholeLineCoversText)
{
    EXPECT_EQ(Rewrite::wholeLine(QStringLiteral("hello")), (TextSpan{0, 5}));
    EXPECT_EQ(Rewrite::wholeLine(QString()), (TextSpan{0, 0}));
    EXPECT_EQ(Rewrite::wholeLine(QStringLiteral("hello")).length(), 5);
}
