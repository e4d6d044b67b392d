/*
 * dayformatter.h — Render journal days as Markdown blocks
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RN2MD_DAYFORMATTER_H
#define RN2MD_DAYFORMATTER_H

#include <QDate>
#include <QList>
#include <QString>

class JournalStore;

namespace DayFormatter {

// "# Oct 19, 2026", always in English month abbreviations.
QString dayHeading(const QDate &day);

// Heading line followed by the converted body. Every day gets its own
// rewrite pipeline so list numbering never leaks between days.
QString formatDay(const QDate &day, const QString &text, int headerPadding = 1);

// Days missing from the store are skipped; the rest are separated by two
// blank lines.
QString formatDays(const QList<QDate> &days, const JournalStore &store,
                   int headerPadding = 1);

// Convert a standalone document; its first line becomes the title.
QString formatDocument(const QString &text, int headerPadding = 1);

} // namespace DayFormatter

#endif // RN2MD_DAYFORMATTER_H
