/*
 * journalstore.cpp — RedNotebook journal loaded from its data directory
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "journalstore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QRegularExpression>

#include <yaml-cpp/yaml.h>

QString JournalStore::defaultDataDirectory()
{
    return QDir::homePath() + QStringLiteral("/.rednotebook/data");
}

QDate JournalStore::monthFromFileName(const QString &fileName)
{
    static const QRegularExpression fileRx(
        QStringLiteral(R"(^(\d{4})-(\d{2})\.txt$)"));

    const auto match = fileRx.match(fileName);
    if (!match.hasMatch())
        return {};

    // An impossible month yields an invalid date.
    return QDate(match.captured(1).toInt(), match.captured(2).toInt(), 1);
}

bool JournalStore::load(const QString &dataDir)
{
    QDir dir(dataDir);
    if (!dir.exists()) {
        qWarning() << "JournalStore: data directory does not exist:" << dataDir;
        return false;
    }

    const QStringList entries = dir.entryList(QDir::Files, QDir::Name);
    int monthFiles = 0;
    for (const QString &entry : entries) {
        if (!entry.endsWith(QLatin1String(".txt")))
            continue;

        const QDate month = monthFromFileName(entry);
        if (!month.isValid()) {
            qWarning() << "JournalStore: skipping" << entry
                       << "(not a YYYY-MM month file)";
            continue;
        }

        if (loadMonthFile(dir.filePath(entry), month))
            ++monthFiles;
    }

    qDebug() << "JournalStore: loaded" << m_days.size() << "days from"
             << monthFiles << "month files in" << dataDir;
    return true;
}

bool JournalStore::loadMonthFile(const QString &path, const QDate &monthDate)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "JournalStore: cannot open" << path;
        return false;
    }
    const QByteArray contents = file.readAll();

    YAML::Node root;
    try {
        root = YAML::Load(contents.toStdString());
    } catch (const YAML::Exception &e) {
        qWarning() << "JournalStore: failed to parse" << path << "error:" << e.what();
        return false;
    }

    // An empty month file is valid and holds no days.
    if (root.IsNull())
        return true;
    if (!root.IsMap()) {
        qWarning() << "JournalStore:" << path << "is not a mapping of days";
        return false;
    }

    for (const auto &entry : root) {
        int day = 0;
        QString text;
        try {
            day = entry.first.as<int>();
            const YAML::Node textNode = entry.second.IsMap() ? entry.second["text"]
                                                             : YAML::Node();
            if (!textNode.IsDefined() || textNode.IsNull())
                continue;
            text = QString::fromStdString(textNode.as<std::string>());
        } catch (const YAML::Exception &e) {
            qWarning() << "JournalStore: skipping malformed day in" << path
                       << "error:" << e.what();
            continue;
        }

        const QDate date(monthDate.year(), monthDate.month(), day);
        if (!date.isValid()) {
            qWarning() << "JournalStore: skipping impossible day" << day
                       << "in" << path;
            continue;
        }
        m_days.insert(date, text);
    }

    return true;
}
