/*
 * contextguards.cpp — Suppress rewrites inside URLs, links and code spans
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "contextguards.h"

#include <QRegularExpression>

namespace Rewrite {

// Scheme, then a host (dotted labels ending in a TLD-like label, or a
// dotted quad), then an optional port. Paths are not part of the match.
static const QRegularExpression &urlPattern()
{
    static const QRegularExpression rx(
        QStringLiteral(R"((?:http|file|ftp)s?://)"
                       R"((?:(?:[A-Z0-9](?:[A-Z0-9-]{0,61}[A-Z0-9])?\.)+)"
                       R"((?:[A-Z]{2,6}\.?|[A-Z0-9-]{2,}\.?)|)"
                       R"(\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}))"
                       R"((?::\d+)?)"),
        QRegularExpression::CaseInsensitiveOption);
    return rx;
}

static const QRegularExpression &linkPattern()
{
    static const QRegularExpression rx(QStringLiteral(R"(\[.*?\]\(.*?\))"));
    return rx;
}

static const QRegularExpression &backtickPattern()
{
    static const QRegularExpression rx(QStringLiteral("`.*?`"));
    return rx;
}

static bool intersectsAnyMatch(const TextSpan &candidate, const QString &line,
                               const QRegularExpression &pattern)
{
    auto it = pattern.globalMatch(line);
    while (it.hasNext()) {
        const auto match = it.next();
        const TextSpan found{static_cast<int>(match.capturedStart()),
                             static_cast<int>(match.capturedEnd())};
        if (intersects(candidate, found))
            return true;
    }
    return false;
}

bool occursInUrl(const TextSpan &candidate, const QString &line)
{
    return intersectsAnyMatch(candidate, line, urlPattern())
           || intersectsAnyMatch(candidate, line, linkPattern());
}

bool occursInBacktick(const TextSpan &candidate, const QString &line)
{
    return intersectsAnyMatch(candidate, line, backtickPattern());
}

} // namespace Rewrite
