/*
 * listrule.h — Numbered list enumeration
 *
 * RedNotebook marks numbered items with '+' and plain bullets with '-'.
 * This rule replaces each '+' with the running number for its
 * indentation depth:
 *
 *   + one          1. one
 *     + nested       1. nested
 *     + nested       2. nested
 *   - bullet       - bullet
 *   + two          2. two
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RN2MD_LISTRULE_H
#define RN2MD_LISTRULE_H

#include <QList>
#include <QRegularExpression>

#include "rule.h"

namespace Rewrite {

class ListRule : public Rule
{
public:
    ListRule();

    TextSpanList findRanges(const QString &line) override;
    QString transform(const QString &target) override;

    // Counter per depth; depth is the offset just past the marker.
    const QList<int> &history() const { return m_history; }

private:
    void updateMisses();
    void resizeHistory(int size);

    QRegularExpression m_pattern;
    QList<int> m_history;
    // One non-list line (e.g. a blank separator) keeps the numbering; a
    // second one in a row ends the list.
    bool m_missedOne = false;
};

} // namespace Rewrite

#endif // RN2MD_LISTRULE_H
