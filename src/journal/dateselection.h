/*
 * dateselection.h — Choose which journal days to print
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RN2MD_DATESELECTION_H
#define RN2MD_DATESELECTION_H

#include <QDate>
#include <QList>
#include <QPair>
#include <QString>

namespace DateSelection {

using DateRange = QPair<QDate, QDate>;

struct Result {
    QList<DateRange> ranges;
    bool valid = true;
    QString errorMessage;   // non-empty if invalid
};

// Strict YYYY-MM-DD. Invalid QDate on any other input.
QDate parseDate(const QString &text);

// begin..end inclusive; empty if end is before begin.
QList<QDate> expandRange(const QDate &begin, const QDate &end);

QList<QDate> today(const QDate &reference);

// Monday through Sunday of the week containing reference.
QList<QDate> week(const QDate &reference);

// The previous working day: Monday looks back to Friday, Sunday to
// Friday as well; every other day looks back one day.
QList<QDate> yesterday(const QDate &reference);

// Find every YYYY-MM-DD in free text and pair them up in order of
// appearance, earlier date first within each pair. A trailing unpaired
// date is ignored.
Result parseRanges(const QString &text);

// Flatten ranges into dates, in order. Overlapping ranges repeat dates.
QList<QDate> expandRanges(const QList<DateRange> &ranges);

} // namespace DateSelection

#endif // RN2MD_DATESELECTION_H
