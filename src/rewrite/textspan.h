/*
 * textspan.h — Half-open character ranges over a line of text
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RN2MD_TEXTSPAN_H
#define RN2MD_TEXTSPAN_H

#include <QList>
#include <QString>

namespace Rewrite {

// [lo, hi) into a specific QString. 0 <= lo <= hi <= length.
struct TextSpan {
    int lo = 0;
    int hi = 0;

    int length() const { return hi - lo; }
    bool operator==(const TextSpan &other) const
    {
        return lo == other.lo && hi == other.hi;
    }
};

using TextSpanList = QList<TextSpan>;

// Inclusive on both ends: spans that merely touch still intersect.
bool intersects(const TextSpan &a, const TextSpan &b);

// Span covering all of `text`.
TextSpan wholeLine(const QString &text);

} // namespace Rewrite

#endif // RN2MD_TEXTSPAN_H
