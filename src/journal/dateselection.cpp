/*
 * dateselection.cpp — Choose which journal days to print
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "dateselection.h"

#include <QRegularExpression>

namespace DateSelection {

QDate parseDate(const QString &text)
{
    static const QRegularExpression dateRx(
        QStringLiteral(R"(^(\d{4})-(\d{2})-(\d{2})$)"));

    const auto match = dateRx.match(text.trimmed());
    if (!match.hasMatch())
        return {};
    return QDate(match.captured(1).toInt(), match.captured(2).toInt(),
                 match.captured(3).toInt());
}

QList<QDate> expandRange(const QDate &begin, const QDate &end)
{
    QList<QDate> dates;
    if (!begin.isValid() || !end.isValid())
        return dates;

    for (QDate d = begin; d <= end; d = d.addDays(1))
        dates.append(d);
    return dates;
}

QList<QDate> today(const QDate &reference)
{
    return {reference};
}

QList<QDate> week(const QDate &reference)
{
    const QDate monday = reference.addDays(1 - reference.dayOfWeek());
    return expandRange(monday, monday.addDays(6));
}

QList<QDate> yesterday(const QDate &reference)
{
    switch (reference.dayOfWeek()) {
    case Qt::Monday:
        return {reference.addDays(-3)};
    case Qt::Sunday:
        return {reference.addDays(-2)};
    default:
        return {reference.addDays(-1)};
    }
}

Result parseRanges(const QString &text)
{
    static const QRegularExpression tokenRx(
        QStringLiteral(R"((\d{4})-(\d{2})-(\d{2}))"));

    Result result;
    QList<QDate> dates;

    auto it = tokenRx.globalMatch(text);
    while (it.hasNext()) {
        const auto match = it.next();
        const QDate date(match.captured(1).toInt(), match.captured(2).toInt(),
                         match.captured(3).toInt());
        if (!date.isValid()) {
            result.valid = false;
            result.errorMessage = QStringLiteral("Not a valid date: '%1'")
                                      .arg(match.captured(0));
            result.ranges.clear();
            return result;
        }
        dates.append(date);
    }

    for (int i = 0; i + 1 < dates.size(); i += 2) {
        const QDate &a = dates[i];
        const QDate &b = dates[i + 1];
        result.ranges.append(a <= b ? DateRange(a, b) : DateRange(b, a));
    }
    return result;
}

QList<QDate> expandRanges(const QList<DateRange> &ranges)
{
    QList<QDate> dates;
    for (const DateRange &range : ranges)
        dates.append(expandRange(range.first, range.second));
    return dates;
}

} // namespace DateSelection
