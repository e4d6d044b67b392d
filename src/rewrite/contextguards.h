/*
 * contextguards.h — Suppress rewrites inside URLs, links and code spans
 *
 * Every guard rescans the whole line it is given. Rules call them with
 * the line as it reached that rule, so offsets always agree with the
 * candidate span even after earlier rules have changed the text.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RN2MD_CONTEXTGUARDS_H
#define RN2MD_CONTEXTGUARDS_H

#include <QString>

#include "textspan.h"

namespace Rewrite {

// True if `candidate` intersects a URL literal (http, https, ftp, ftps,
// file, files) or an already formed Markdown link [text](target).
bool occursInUrl(const TextSpan &candidate, const QString &line);

// True if `candidate` intersects a `code` span.
bool occursInBacktick(const TextSpan &candidate, const QString &line);

} // namespace Rewrite

#endif // RN2MD_CONTEXTGUARDS_H
