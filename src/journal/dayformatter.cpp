/*
 * dayformatter.cpp — Render journal days as Markdown blocks
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "dayformatter.h"

#include "journalstore.h"
#include "rewrite/pipeline.h"

#include <QLocale>
#include <QStringList>

namespace DayFormatter {

static const QString kDaySeparator = QStringLiteral("\n\n\n");

static QString trimmedRight(const QString &line)
{
    int end = line.length();
    while (end > 0 && line[end - 1].isSpace())
        --end;
    return line.left(end);
}

static QString convertLines(const QString &text, Rewrite::Pipeline &pipeline)
{
    const QStringList lines = text.split(QLatin1Char('\n'));
    QStringList converted;
    converted.reserve(lines.size());
    for (const QString &line : lines)
        converted.append(pipeline.run(trimmedRight(line)));
    return converted.join(QLatin1Char('\n'));
}

QString dayHeading(const QDate &day)
{
    return QStringLiteral("# ")
           + QLocale::c().toString(day, QStringLiteral("MMM dd, yyyy"));
}

QString formatDay(const QDate &day, const QString &text, int headerPadding)
{
    Rewrite::Pipeline pipeline = Rewrite::Pipeline::journal(headerPadding);
    const QString body = convertLines(text, pipeline);
    const QString heading = dayHeading(day);

    if (body.isEmpty())
        return heading;
    return heading + QLatin1Char('\n') + body;
}

QString formatDays(const QList<QDate> &days, const JournalStore &store,
                   int headerPadding)
{
    QStringList blocks;
    for (const QDate &day : days) {
        if (store.contains(day))
            blocks.append(formatDay(day, store.text(day), headerPadding));
    }
    return blocks.join(kDaySeparator);
}

QString formatDocument(const QString &text, int headerPadding)
{
    Rewrite::Pipeline pipeline = Rewrite::Pipeline::document(headerPadding);
    return convertLines(text, pipeline);
}

} // namespace DayFormatter
