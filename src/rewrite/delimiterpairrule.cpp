/*
 * delimiterpairrule.cpp — Inline emphasis written as paired delimiters
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "delimiterpairrule.h"

#include "contextguards.h"

namespace Rewrite {

DelimiterPairRule::DelimiterPairRule(const QString &delimiter,
                                     const QString &marker)
    : m_delimiter(delimiter)
    , m_marker(marker)
    , m_pattern(QRegularExpression::escape(delimiter))
{
}

TextSpanList DelimiterPairRule::findRanges(const QString &line)
{
    TextSpanList delimiters;
    auto it = m_pattern.globalMatch(line);
    while (it.hasNext()) {
        const auto match = it.next();
        const TextSpan span{static_cast<int>(match.capturedStart()),
                            static_cast<int>(match.capturedEnd())};
        if (occursInUrl(span, line) || occursInBacktick(span, line))
            continue;
        delimiters.append(span);
    }

    TextSpanList ranges;
    for (int i = 0; i + 1 < delimiters.size(); i += 2)
        ranges.append({delimiters[i].lo, delimiters[i + 1].hi});
    return ranges;
}

QString DelimiterPairRule::transform(const QString &target)
{
    const int width = static_cast<int>(m_delimiter.length());
    return m_marker + target.mid(width, target.length() - 2 * width) + m_marker;
}

ItalicsRule::ItalicsRule()
    : DelimiterPairRule(QStringLiteral("//"), QStringLiteral("_"))
{
}

StrikethroughRule::StrikethroughRule()
    : DelimiterPairRule(QStringLiteral("--"), QStringLiteral("~~"))
{
}

} // namespace Rewrite
