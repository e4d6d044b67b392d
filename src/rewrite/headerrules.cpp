/*
 * headerrules.cpp — Heading conversions
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "headerrules.h"

namespace Rewrite {

static constexpr QChar kEquals(u'=');

// Length of the run of '=' at the start (or, reversed, the end) of text.
static int leadingEquals(const QString &text)
{
    int n = 0;
    while (n < text.length() && text[n] == kEquals)
        ++n;
    return n;
}

static int trailingEquals(const QString &text)
{
    int n = 0;
    while (n < text.length() && text[text.length() - 1 - n] == kEquals)
        ++n;
    return n;
}

HeaderRule::HeaderRule(int padding)
    : m_padding(padding)
{
}

TextSpanList HeaderRule::findRanges(const QString &line)
{
    const int leading = leadingEquals(line);
    // A line made only of '=' has no title to wrap.
    if (leading == line.length())
        return {};

    if (leading > 0 && leading == trailingEquals(line))
        return {wholeLine(line)};
    return {};
}

QString HeaderRule::transform(const QString &target)
{
    const int level = leadingEquals(target);
    return QString(m_padding + level, QLatin1Char('#'))
           + QLatin1Char(' ')
           + target.mid(level, target.length() - 2 * level);
}

TextSpanList FirstLineHeaderRule::findRanges(const QString &line)
{
    if (m_pastFirstLine)
        return {};
    return {wholeLine(line)};
}

QString FirstLineHeaderRule::transform(const QString &target)
{
    m_pastFirstLine = true;
    return QStringLiteral("# ") + target;
}

} // namespace Rewrite
