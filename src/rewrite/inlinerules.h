/*
 * inlinerules.h — Code span unwrapping and underscore escaping
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RN2MD_INLINERULES_H
#define RN2MD_INLINERULES_H

#include <QRegularExpression>

#include "rule.h"

namespace Rewrite {

// ``code`` -> `code`. Occurrences inside a URL or link are kept.
class BacktickRule : public Rule
{
public:
    BacktickRule();

    TextSpanList findRanges(const QString &line) override;
    QString transform(const QString &target) override;

private:
    QRegularExpression m_pattern;
};

// snake_case -> snake\_case, so Markdown renderers do not read the
// underscores as emphasis. Only underscores with a word character on both
// sides are escaped.
class EscapeUnderscoreRule : public Rule
{
public:
    EscapeUnderscoreRule();

    TextSpanList findRanges(const QString &line) override;
    QString transform(const QString &target) override;

private:
    QRegularExpression m_pattern;
};

} // namespace Rewrite

#endif // RN2MD_INLINERULES_H
