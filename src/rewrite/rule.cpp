/*
 * rule.cpp — Base class for a single markup rewrite
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "rule.h"

namespace Rewrite {

QString Rule::apply(const QString &line)
{
    return morph(line, findRanges(line));
}

QString Rule::morph(const QString &line, const TextSpanList &ranges)
{
    if (ranges.isEmpty())
        return line;

    // Zero-width sentinels at both ends let every range be handled as the
    // middle of a (previous, current, next) triple.
    TextSpanList bounds;
    bounds.reserve(ranges.size() + 2);
    bounds.append({0, 0});
    bounds.append(ranges);
    const int end = static_cast<int>(line.length());
    bounds.append({end, end});

    QString output;
    output.reserve(line.length());
    output += line.mid(bounds[0].hi, bounds[1].lo - bounds[0].hi);

    for (int i = 1; i + 1 < bounds.size(); ++i) {
        const TextSpan &current = bounds[i];
        const TextSpan &next = bounds[i + 1];
        output += transform(line.mid(current.lo, current.length()));
        output += line.mid(current.hi, next.lo - current.hi);
    }

    return output;
}

} // namespace Rewrite
