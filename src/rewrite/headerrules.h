/*
 * headerrules.h — Heading conversions
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RN2MD_HEADERRULES_H
#define RN2MD_HEADERRULES_H

#include "rule.h"

namespace Rewrite {

// =Title= -> # Title, ==Title== -> ## Title, ...
//
// Only whole lines wrapped in equally long runs of '=' are converted.
// `padding` is added to the run length, so with padding 1 a top-level
// RedNotebook title becomes "##", leaving "#" free for the day header.
class HeaderRule : public Rule
{
public:
    explicit HeaderRule(int padding = 0);

    TextSpanList findRanges(const QString &line) override;
    QString transform(const QString &target) override;

    int padding() const { return m_padding; }

private:
    int m_padding = 0;
};

// Prefixes the first line this instance ever sees with "# ". One-shot:
// create a new instance for each document.
class FirstLineHeaderRule : public Rule
{
public:
    FirstLineHeaderRule() = default;

    TextSpanList findRanges(const QString &line) override;
    QString transform(const QString &target) override;

    bool pastFirstLine() const { return m_pastFirstLine; }

private:
    bool m_pastFirstLine = false;
};

} // namespace Rewrite

#endif // RN2MD_HEADERRULES_H
