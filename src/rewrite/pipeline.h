/*
 * pipeline.h — Ordered chain of rewrite rules
 *
 * Each rule's output is the next rule's input. Several rules keep state
 * from line to line (list numbering, first-line header), so a pipeline
 * belongs to exactly one document: build a new one per document.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RN2MD_PIPELINE_H
#define RN2MD_PIPELINE_H

#include <QList>
#include <QString>
#include <QStringList>

namespace Rewrite {

class Rule;

class Pipeline
{
public:
    Pipeline() = default;
    ~Pipeline();

    Pipeline(Pipeline &&other) noexcept;
    Pipeline &operator=(Pipeline &&other) noexcept;

    // Takes ownership of `rule`; it runs after the rules already added.
    void addRule(Rule *rule);

    QString run(const QString &line);
    QStringList runAll(const QStringList &lines);

    int ruleCount() const { return m_rules.size(); }
    bool isEmpty() const { return m_rules.isEmpty(); }

    // RedNotebook day text to Markdown: headers (with the given padding),
    // images, links, code spans, italics, numbered lists, strikethrough,
    // underscore escaping.
    static Pipeline journal(int headerPadding = 1);

    // As journal(), with the first line of the document turned into a
    // top-level heading.
    static Pipeline document(int headerPadding = 1);

private:
    Q_DISABLE_COPY(Pipeline)

    QList<Rule *> m_rules;
};

} // namespace Rewrite

#endif // RN2MD_PIPELINE_H
