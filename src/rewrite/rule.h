/*
 * rule.h — Base class for a single markup rewrite
 *
 * A rule locates the substrings of a line it wants to replace
 * (findRanges) and computes the replacement for each of them
 * (transform). apply() stitches the result together: untouched gaps are
 * copied verbatim and every target range is replaced by its transform.
 *
 * Example: a rule that upper-cases vowels would return one range per
 * vowel from findRanges() and the upper-cased character from transform().
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RN2MD_RULE_H
#define RN2MD_RULE_H

#include <QString>

#include "textspan.h"

namespace Rewrite {

class Rule
{
public:
    virtual ~Rule() = default;

    // Ranges of `line` to replace: sorted by start, pairwise disjoint.
    // Rules with per-document state update it here.
    virtual TextSpanList findRanges(const QString &line) = 0;

    // Replacement for one substring selected by findRanges().
    virtual QString transform(const QString &target) = 0;

    // Rewrite `line`. Returns it unchanged when findRanges() finds
    // nothing; transform() is not called in that case.
    QString apply(const QString &line);

    // Interleave the gaps between `ranges` with transform() of each range.
    QString morph(const QString &line, const TextSpanList &ranges);

protected:
    Rule() = default;
    Q_DISABLE_COPY(Rule)
};

} // namespace Rewrite

#endif // RN2MD_RULE_H
