/*
 * qtprinters.h — GoogleTest printers for Qt value types
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RN2MD_QTPRINTERS_H
#define RN2MD_QTPRINTERS_H

#include <QDate>
#include <QString>

#include <ostream>

#include "rewrite/textspan.h"

inline void PrintTo(const QString &text, std::ostream *os)
{
    *os << '"' << text.toStdString() << '"';
}

inline void PrintTo(const QDate &date, std::ostream *os)
{
    *os << date.toString(Qt::ISODate).toStdString();
}

namespace Rewrite {

inline void PrintTo(const TextSpan &span, std::ostream *os)
{
    *os << '[' << span.lo << ", " << span.hi << ')';
}

} // namespace Rewrite

#endif // RN2MD_QTPRINTERS_H
