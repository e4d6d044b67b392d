/*
 * delimiterpairrule.h — Inline emphasis written as paired delimiters
 *
 *   RedNotebook    Markdown
 *   //text//       _text_
 *   --text--       ~~text~~
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RN2MD_DELIMITERPAIRRULE_H
#define RN2MD_DELIMITERPAIRRULE_H

#include <QRegularExpression>

#include "rule.h"

namespace Rewrite {

// Pairs consecutive delimiter occurrences as (open, close), skipping any
// occurrence inside a URL, link or code span. An odd trailing delimiter
// is left alone.
class DelimiterPairRule : public Rule
{
public:
    TextSpanList findRanges(const QString &line) override;
    QString transform(const QString &target) override;

protected:
    DelimiterPairRule(const QString &delimiter, const QString &marker);

private:
    QString m_delimiter;
    QString m_marker;
    QRegularExpression m_pattern;
};

class ItalicsRule : public DelimiterPairRule
{
public:
    ItalicsRule();
};

class StrikethroughRule : public DelimiterPairRule
{
public:
    StrikethroughRule();
};

} // namespace Rewrite

#endif // RN2MD_DELIMITERPAIRRULE_H
