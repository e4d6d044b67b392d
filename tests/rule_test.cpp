/*
 * rule_test.cpp — Span morphing shared by every rule
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "qtprinters.h"
#include "rewrite/rule.h"

#include <QRegularExpression>

namespace
{

using Rewrite::TextSpanList;

// Upper-cases vowels and counts transform() calls.
class VowelRule : public Rewrite::Rule
{
public:
    TextSpanList findRanges(const QString &line) override
    {
        TextSpanList ranges;
        static const QRegularExpression vowelRx(QStringLiteral("[aeiou]"));
        auto it = vowelRx.globalMatch(line);
        while (it.hasNext()) {
            const auto match = it.next();
            ranges.append({static_cast<int>(match.capturedStart()),
                           static_cast<int>(match.capturedEnd())});
        }
        return ranges;
    }

    QString transform(const QString &target) override
    {
        ++calls;
        return target.toUpper();
    }

    int calls = 0;
};

// Replaces fixed ranges with "<...>" around the original text.
class FixedRangesRule : public Rewrite::Rule
{
public:
    explicit FixedRangesRule(const TextSpanList &ranges)
        : m_ranges(ranges)
    {
    }

    TextSpanList findRanges(const QString &) override { return m_ranges; }

    QString transform(const QString &target) override
    {
        consumed += target.length();
        return QStringLiteral("<") + target + QStringLiteral(">");
    }

    int consumed = 0;

private:
    TextSpanList m_ranges;
};

} // namespace

TEST(Morph, ReplacesEveryRange)
{
    VowelRule rule;
    EXPECT_EQ(rule.apply(QStringLiteral("i love sour patches!")),
              QStringLiteral("I lOvE sOUr pAtchEs!"));
}

TEST(Morph, NoRangesLeavesLineUntouched)
{
    VowelRule rule;
    EXPECT_EQ(rule.apply(QStringLiteral("rhythm")), QStringLiteral("rhythm"));
    EXPECT_EQ(rule.apply(QString()), QString());
    EXPECT_EQ(rule.calls, 0);
}

TEST(Morph, KeepsTextBeforeBetweenAndAfterRanges)
{
    FixedRangesRule rule({{2, 4}, {6, 7}});
    EXPECT_EQ(rule.apply(QStringLiteral("abcdefghij")),
              QStringLiteral("ab<cd>ef<g>hij"));
}

TEST(Morph, RangesAtBothEnds)
{
    FixedRangesRule rule({{0, 2}, {8, 10}});
    EXPECT_EQ(rule.apply(QStringLiteral("abcdefghij")),
              QStringLiteral("<ab>cdefgh<ij>"));
}

TEST(Morph, AdjacentRanges)
{
    FixedRangesRule rule({{1, 3}, {3, 5}});
    EXPECT_EQ(rule.apply(QStringLiteral("abcdef")),
              QStringLiteral("a<bc><de>f"));
}

TEST(Morph, ZeroWidthRangeInsertsText)
{
    FixedRangesRule rule({{3, 3}});
    EXPECT_EQ(rule.apply(QStringLiteral("abcdef")), QStringLiteral("abc<>def"));
}

TEST(Morph, EveryCharacterConsumedOnce)
{
    const QString line = QStringLiteral("the quick brown fox");
    FixedRangesRule rule({{0, 3}, {4, 9}, {16, 19}});
    const QString result = rule.apply(line);

    const int gaps = 1 + 7;   // " " and " brown "
    EXPECT_EQ(rule.consumed + gaps, line.length());
    // Each transform adds the two angle brackets.
    EXPECT_EQ(result.length(), line.length() + 3 * 2);
    EXPECT_EQ(result, QStringLiteral("<the> <quick> brown <fox>"));
}
