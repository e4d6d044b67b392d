/*
 * listrule.cpp — Numbered list enumeration
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "listrule.h"

namespace Rewrite {

ListRule::ListRule()
    : m_pattern(QStringLiteral(R"(^\s*(\+|-)\s)"),
                QRegularExpression::UseUnicodePropertiesOption)
{
}

TextSpanList ListRule::findRanges(const QString &line)
{
    const auto match = m_pattern.match(line);
    if (!match.hasMatch()) {
        updateMisses();
        return {};
    }

    resizeHistory(static_cast<int>(match.capturedEnd(1)));
    if (match.captured(1) != QLatin1String("+"))
        return {};

    ++m_history.last();
    return {{static_cast<int>(match.capturedStart(1)),
             static_cast<int>(match.capturedEnd(1))}};
}

QString ListRule::transform(const QString &)
{
    return QString::number(m_history.last()) + QLatin1Char('.');
}

void ListRule::updateMisses()
{
    if (m_missedOne)
        m_history.clear();
    else
        m_missedOne = true;
}

void ListRule::resizeHistory(int size)
{
    m_missedOne = false;
    // Deeper levels are forgotten; new levels start from zero.
    m_history.resize(qMin<qsizetype>(m_history.size(), size));
    while (m_history.size() < size)
        m_history.append(0);
}

} // namespace Rewrite
