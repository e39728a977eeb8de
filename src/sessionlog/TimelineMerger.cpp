/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TimelineMerger.h"

#include "MessageNormalizer.h"
#include "SubagentCorrelator.h"

#include <QDateTime>
#include <QDebug>
#include <QSet>

#include <algorithm>
#include <limits>
#include <numeric>
#include <vector>

namespace Callboard
{

TimelineMerger::TimelineMerger(const SessionLogSource *source)
    : m_source(source)
{
}

QString TimelineMerger::subagentLabel(const QString &agentId, const QHash<QString, QString> &correlated, const QList<SessionLogRecord> &subagentRecords)
{
    const QString description = correlated.value(agentId);
    if (!description.isEmpty()) {
        return description;
    }

    for (const SessionLogRecord &record : subagentRecords) {
        if (!record.embeddedAgentLabel.isEmpty()) {
            return record.embeddedAgentLabel;
        }
    }

    return SubagentCorrelator::fallbackLabel(agentId);
}

void TimelineMerger::sortByTimestamp(QList<ConversationMessage> &messages)
{
    const qsizetype count = messages.size();

    std::vector<qint64> keys(static_cast<size_t>(count));
    qint64 carried = std::numeric_limits<qint64>::min();
    for (qsizetype i = 0; i < count; ++i) {
        const QDateTime parsed = QDateTime::fromString(messages.at(i).timestamp, Qt::ISODateWithMs);
        if (parsed.isValid()) {
            carried = parsed.toMSecsSinceEpoch();
        }
        keys[static_cast<size_t>(i)] = carried;
    }

    std::vector<qsizetype> order(static_cast<size_t>(count));
    std::iota(order.begin(), order.end(), qsizetype(0));
    std::stable_sort(order.begin(), order.end(), [&keys](qsizetype a, qsizetype b) {
        return keys[static_cast<size_t>(a)] < keys[static_cast<size_t>(b)];
    });

    QList<ConversationMessage> sorted;
    sorted.reserve(count);
    for (qsizetype index : order) {
        sorted.append(messages.at(index));
    }
    messages = std::move(sorted);
}

QList<ConversationMessage> TimelineMerger::mergeTimeline(const QStringList &sessionIds) const
{
    if (!m_source) {
        return {};
    }

    // Ordered set: first occurrence wins
    QStringList orderedIds;
    QSet<QString> seen;
    for (const QString &id : sessionIds) {
        if (!id.isEmpty() && !seen.contains(id)) {
            seen.insert(id);
            orderedIds.append(id);
        }
    }

    QList<SessionLogRecord> parentRecords;
    for (const QString &sessionId : orderedIds) {
        const QString logPath = m_source->findLogFileForSession(sessionId);
        if (logPath.isEmpty()) {
            qDebug() << "TimelineMerger: No log file for session" << sessionId;
            continue;
        }
        parentRecords.append(SessionLogDecoder::readFile(logPath));
    }

    QList<ConversationMessage> timeline = MessageNormalizer::normalize(parentRecords);
    const QHash<QString, QString> labels = SubagentCorrelator::correlate(parentRecords);

    bool hasSubagentMessages = false;
    for (const QString &sessionId : orderedIds) {
        const QList<SubagentLogFile> subagents = m_source->findSubagentLogFiles(sessionId);
        for (const SubagentLogFile &subagent : subagents) {
            const QList<SessionLogRecord> records = SessionLogDecoder::readFile(subagent.path);
            const QString label = subagentLabel(subagent.agentId, labels, records);
            const QList<ConversationMessage> messages = MessageNormalizer::normalize(records, label);
            if (!messages.isEmpty()) {
                hasSubagentMessages = true;
                timeline.append(messages);
            }
        }
    }

    if (hasSubagentMessages) {
        sortByTimestamp(timeline);
    }

    return timeline;
}

} // namespace Callboard
