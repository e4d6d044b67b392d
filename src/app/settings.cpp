/*
 * settings.cpp — Persistent rn2md settings (rn2mdrc)
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "settings.h"

#include "journal/journalstore.h"

#include <KConfigGroup>
#include <KSharedConfig>

Settings Settings::load(const QString &configName)
{
    KSharedConfig::Ptr config = KSharedConfig::openConfig(configName);

    Settings settings;
    KConfigGroup journal(config, QStringLiteral("Journal"));
    settings.dataDirectory = journal.readPathEntry(
        "DataDirectory", JournalStore::defaultDataDirectory());

    KConfigGroup conversion(config, QStringLiteral("Conversion"));
    settings.headerPadding = qMax(0, conversion.readEntry("HeaderPadding", 1));
    return settings;
}

void Settings::save(const QString &configName) const
{
    KSharedConfig::Ptr config = KSharedConfig::openConfig(configName);

    KConfigGroup journal(config, QStringLiteral("Journal"));
    journal.writePathEntry("DataDirectory", dataDirectory);

    KConfigGroup conversion(config, QStringLiteral("Conversion"));
    conversion.writeEntry("HeaderPadding", headerPadding);

    config->sync();
}
