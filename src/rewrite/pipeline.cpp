/*
 * pipeline.cpp — Ordered chain of rewrite rules
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pipeline.h"

#include "delimiterpairrule.h"
#include "headerrules.h"
#include "inlinerules.h"
#include "linkrules.h"
#include "listrule.h"

#include <utility>

namespace Rewrite {

Pipeline::~Pipeline()
{
    qDeleteAll(m_rules);
}

Pipeline::Pipeline(Pipeline &&other) noexcept
    : m_rules(std::exchange(other.m_rules, {}))
{
}

Pipeline &Pipeline::operator=(Pipeline &&other) noexcept
{
    if (this != &other) {
        qDeleteAll(m_rules);
        m_rules = std::exchange(other.m_rules, {});
    }
    return *this;
}

void Pipeline::addRule(Rule *rule)
{
    if (rule)
        m_rules.append(rule);
}

QString Pipeline::run(const QString &line)
{
    QString result = line;
    for (Rule *rule : std::as_const(m_rules))
        result = rule->apply(result);
    return result;
}

QStringList Pipeline::runAll(const QStringList &lines)
{
    QStringList result;
    result.reserve(lines.size());
    for (const QString &line : lines)
        result.append(run(line));
    return result;
}

Pipeline Pipeline::journal(int headerPadding)
{
    Pipeline pipeline;
    pipeline.addRule(new HeaderRule(headerPadding));
    pipeline.addRule(new ImageRule);
    pipeline.addRule(new LinkRule);
    // Code spans must be single-backticked before the guarded rules run.
    pipeline.addRule(new BacktickRule);
    pipeline.addRule(new ItalicsRule);
    pipeline.addRule(new ListRule);
    pipeline.addRule(new StrikethroughRule);
    pipeline.addRule(new EscapeUnderscoreRule);
    return pipeline;
}

Pipeline Pipeline::document(int headerPadding)
{
    Pipeline pipeline = journal(headerPadding);
    pipeline.addRule(new FirstLineHeaderRule);
    return pipeline;
}

} // namespace Rewrite
