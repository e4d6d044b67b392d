/*
 * inlinerules.cpp — Code span unwrapping and underscore escaping
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "inlinerules.h"

#include "contextguards.h"

namespace Rewrite {

BacktickRule::BacktickRule()
    : m_pattern(QStringLiteral("``.*?``"))
{
}

TextSpanList BacktickRule::findRanges(const QString &line)
{
    TextSpanList ranges;
    auto it = m_pattern.globalMatch(line);
    while (it.hasNext()) {
        const auto match = it.next();
        const TextSpan span{static_cast<int>(match.capturedStart()),
                            static_cast<int>(match.capturedEnd())};
        if (!occursInUrl(span, line))
            ranges.append(span);
    }
    return ranges;
}

QString BacktickRule::transform(const QString &target)
{
    return target.mid(1, target.length() - 2);
}

EscapeUnderscoreRule::EscapeUnderscoreRule()
    : m_pattern(QStringLiteral(R"((?<=\w)_(?=\w))"),
                QRegularExpression::UseUnicodePropertiesOption)
{
}

TextSpanList EscapeUnderscoreRule::findRanges(const QString &line)
{
    TextSpanList ranges;
    auto it = m_pattern.globalMatch(line);
    while (it.hasNext()) {
        const auto match = it.next();
        const TextSpan span{static_cast<int>(match.capturedStart()),
                            static_cast<int>(match.capturedEnd())};
        if (occursInUrl(span, line) || occursInBacktick(span, line))
            continue;
        ranges.append(span);
    }
    return ranges;
}

QString EscapeUnderscoreRule::transform(const QString &)
{
    return QStringLiteral(R"(\_)");
}

} // namespace Rewrite
