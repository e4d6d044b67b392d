/*
 * main.cpp — rn2md command line entry point
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDate>
#include <QFile>
#include <QTextStream>

#include <KAboutData>
#include <KLocalizedString>

#include "journal/dateselection.h"
#include "journal/dayformatter.h"
#include "journal/journalstore.h"
#include "settings.h"

static QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

static QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

static int fail(const QString &message)
{
    err() << message << Qt::endl;
    return 1;
}

static QString readStandardInput()
{
    QFile input;
    if (!input.open(stdin, QIODevice::ReadOnly))
        return {};
    return QString::fromUtf8(input.readAll());
}

static void print(const QString &text)
{
    if (!text.isEmpty())
        out() << text << Qt::endl;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("rn2md");

    KAboutData aboutData(
        QStringLiteral("rn2md"),
        i18n("rn2md"),
        QStringLiteral("0.1.0"),
        i18n("Print RedNotebook journal entries as Markdown"),
        KAboutLicense::GPL_V2,
        i18n("(c) 2016-2026"));
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);
    parser.addPositionalArgument(
        QStringLiteral("command"),
        i18n("today (default), yesterday, week, range, ranges or convert"),
        QStringLiteral("[command]"));

    const QCommandLineOption startOption(
        {QStringLiteral("f"), QStringLiteral("start")},
        i18n("First date of a range (YYYY-MM-DD)."), QStringLiteral("date"));
    const QCommandLineOption endOption(
        {QStringLiteral("t"), QStringLiteral("end")},
        i18n("Last date of a range (YYYY-MM-DD)."), QStringLiteral("date"));
    const QCommandLineOption dataDirOption(
        QStringLiteral("data-dir"),
        i18n("RedNotebook data directory."), QStringLiteral("dir"));
    const QCommandLineOption paddingOption(
        QStringLiteral("padding"),
        i18n("Extra heading levels added to converted headers."),
        QStringLiteral("n"));
    const QCommandLineOption rememberOption(
        QStringLiteral("remember"),
        i18n("Store --data-dir and --padding as the new defaults."));
    parser.addOptions({startOption, endOption, dataDirOption, paddingOption,
                       rememberOption});

    parser.process(app);
    aboutData.processCommandLine(&parser);

    Settings settings = Settings::load();
    if (parser.isSet(dataDirOption))
        settings.dataDirectory = parser.value(dataDirOption);
    if (parser.isSet(paddingOption)) {
        bool ok = false;
        const int padding = parser.value(paddingOption).toInt(&ok);
        if (!ok || padding < 0)
            return fail(i18n("Not a valid padding: '%1'.", parser.value(paddingOption)));
        settings.headerPadding = padding;
    }
    if (parser.isSet(rememberOption))
        settings.save();

    const QStringList args = parser.positionalArguments();
    const QString command = args.isEmpty() ? QStringLiteral("today") : args.first();

    if (command == QLatin1String("convert")) {
        QString text = readStandardInput();
        if (text.endsWith(QLatin1Char('\n')))
            text.chop(1);
        print(DayFormatter::formatDocument(text, settings.headerPadding));
        return 0;
    }

    const QDate today = QDate::currentDate();
    QList<QDate> dates;

    if (command == QLatin1String("today")) {
        dates = DateSelection::today(today);
    } else if (command == QLatin1String("yesterday")) {
        dates = DateSelection::yesterday(today);
    } else if (command == QLatin1String("week")) {
        dates = DateSelection::week(today);
    } else if (command == QLatin1String("range")) {
        if (!parser.isSet(startOption) || !parser.isSet(endOption))
            return fail(i18n("range needs both --start and --end."));
        const QDate start = DateSelection::parseDate(parser.value(startOption));
        if (!start.isValid())
            return fail(i18n("Not a valid date: '%1'.", parser.value(startOption)));
        const QDate end = DateSelection::parseDate(parser.value(endOption));
        if (!end.isValid())
            return fail(i18n("Not a valid date: '%1'.", parser.value(endOption)));
        dates = DateSelection::expandRange(start, end);
    } else if (command == QLatin1String("ranges")) {
        const DateSelection::Result result =
            DateSelection::parseRanges(readStandardInput());
        if (!result.valid)
            return fail(result.errorMessage);
        dates = DateSelection::expandRanges(result.ranges);
    } else {
        return fail(i18n("Unknown command: '%1'.", command));
    }

    JournalStore store;
    if (!store.load(settings.dataDirectory))
        return fail(i18n("Cannot read journal data from '%1'.", settings.dataDirectory));

    print(DayFormatter::formatDays(dates, store, settings.headerPadding));
    return 0;
}
