/*
 * linkrules.h — Links and embedded images
 *
 *   RedNotebook                    Markdown
 *   [name ""url""]                 [name](url)
 *   [""file:///pic"".png]          ![](file:///pic.png)
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RN2MD_LINKRULES_H
#define RN2MD_LINKRULES_H

#include <QRegularExpression>

#include "rule.h"

namespace Rewrite {

// Underscores and asterisks in the target are backslash-escaped.
class LinkRule : public Rule
{
public:
    LinkRule();

    TextSpanList findRanges(const QString &line) override;
    QString transform(const QString &target) override;

private:
    QRegularExpression m_pattern;
    QRegularExpression m_separator;
};

// Local images with a jpg, tif, png or gif extension.
class ImageRule : public Rule
{
public:
    ImageRule();

    TextSpanList findRanges(const QString &line) override;
    QString transform(const QString &target) override;

private:
    QRegularExpression m_pattern;
};

} // namespace Rewrite

#endif // RN2MD_LINKRULES_H
