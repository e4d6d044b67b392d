/*
 * linkrules.cpp — Links and embedded images
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "linkrules.h"

namespace Rewrite {

LinkRule::LinkRule()
    : m_pattern(QStringLiteral(R"(\[[^"].*?""\])"))
    , m_separator(QStringLiteral(R"(\s"")"),
                  QRegularExpression::UseUnicodePropertiesOption)
{
}

TextSpanList LinkRule::findRanges(const QString &line)
{
    TextSpanList ranges;
    auto it = m_pattern.globalMatch(line);
    while (it.hasNext()) {
        const auto match = it.next();
        // Without whitespace before the opening quotes there is no name to
        // split off; leave the text as written.
        if (!m_separator.match(match.captured()).hasMatch())
            continue;
        ranges.append({static_cast<int>(match.capturedStart()),
                       static_cast<int>(match.capturedEnd())});
    }
    return ranges;
}

QString LinkRule::transform(const QString &target)
{
    // target is: [name ""url""]
    const auto separator = m_separator.match(target);
    if (!separator.hasMatch())
        return target;

    const int urlStart = static_cast<int>(separator.capturedEnd());
    const int urlEnd = static_cast<int>(target.length()) - 3;
    const QString name = target.mid(1, separator.capturedStart() - 1).trimmed();
    QString url = target.mid(urlStart, qMax(0, urlEnd - urlStart)).trimmed();

    url.replace(QLatin1Char('_'), QLatin1String(R"(\_)"));
    url.replace(QLatin1Char('*'), QLatin1String(R"(\*)"));

    return QStringLiteral("[") + name + QStringLiteral("](") + url + QLatin1Char(')');
}

ImageRule::ImageRule()
    : m_pattern(QStringLiteral(R"(\[""(file://.*?)""(\.(?:jpg|tif|png|gif))\])"))
{
}

TextSpanList ImageRule::findRanges(const QString &line)
{
    TextSpanList ranges;
    auto it = m_pattern.globalMatch(line);
    while (it.hasNext()) {
        const auto match = it.next();
        ranges.append({static_cast<int>(match.capturedStart()),
                       static_cast<int>(match.capturedEnd())});
    }
    return ranges;
}

QString ImageRule::transform(const QString &target)
{
    const auto match = m_pattern.match(target);
    if (!match.hasMatch())
        return target;
    return QStringLiteral("![](") + match.captured(1) + match.captured(2)
           + QLatin1Char(')');
}

} // namespace Rewrite
