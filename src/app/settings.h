/*
 * settings.h — Persistent rn2md settings (rn2mdrc)
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RN2MD_SETTINGS_H
#define RN2MD_SETTINGS_H

#include <QString>

struct Settings {
    QString dataDirectory;
    int headerPadding = 1;

    // Read from the given config file name (resolved by KSharedConfig),
    // falling back to defaults for missing keys.
    static Settings load(const QString &configName = QStringLiteral("rn2mdrc"));
    void save(const QString &configName = QStringLiteral("rn2mdrc")) const;
};

#endif // RN2MD_SETTINGS_H
