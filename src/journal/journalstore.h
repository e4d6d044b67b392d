/*
 * journalstore.h — RedNotebook journal loaded from its data directory
 *
 * The data directory holds one YAML file per month, named YYYY-MM.txt:
 *
 *   1: {text: "first entry"}
 *   17:
 *     text: |
 *       =Heading=
 *       body
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RN2MD_JOURNALSTORE_H
#define RN2MD_JOURNALSTORE_H

#include <QDate>
#include <QList>
#include <QMap>
#include <QString>

class JournalStore
{
public:
    JournalStore() = default;

    // Load every month file in dataDir. Returns false if the directory
    // does not exist; unreadable month files are skipped with a warning.
    bool load(const QString &dataDir);

    // Merge the days of one month file. monthDate is any date in the
    // month. Returns false if the file cannot be read or parsed.
    bool loadMonthFile(const QString &path, const QDate &monthDate);

    bool contains(const QDate &date) const { return m_days.contains(date); }
    QString text(const QDate &date) const { return m_days.value(date); }
    QList<QDate> dates() const { return m_days.keys(); }
    bool isEmpty() const { return m_days.isEmpty(); }
    int dayCount() const { return m_days.size(); }

    void insert(const QDate &date, const QString &text) { m_days.insert(date, text); }

    static QString defaultDataDirectory();

    // "2024-03.txt" -> 2024-03-01; invalid QDate if the name does not
    // follow the month file pattern.
    static QDate monthFromFileName(const QString &fileName);

private:
    QMap<QDate, QString> m_days;
};

#endif // RN2MD_JOURNALSTORE_H
