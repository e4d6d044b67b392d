/*
 * textspan.cpp — Half-open character ranges over a line of text
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "textspan.h"

namespace Rewrite {

bool intersects(const TextSpan &a, const TextSpan &b)
{
    return a.hi >= b.lo && b.hi >= a.lo;
}

TextSpan wholeLine(const QString &text)
{
    return {0, static_cast<int>(text.length())};
}

} // namespace Rewrite
