/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TIMELINEMERGER_H
#define TIMELINEMERGER_H

#include "callboard_export.h"

#include "ConversationMessage.h"
#include "SessionLogRecord.h"
#include "SessionLogSource.h"

#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>

namespace Callboard
{

/**
 * TimelineMerger builds one conversation timeline out of every session log
 * of a chat plus the subagent logs those sessions spawned.
 *
 * Parent records are concatenated in session id order and normalized as a
 * whole. Subagent messages are tagged with a team label; when any exist the
 * combined list is stable-sorted by timestamp, otherwise parent order is
 * returned untouched.
 */
class CALLBOARD_EXPORT TimelineMerger
{
public:
    explicit TimelineMerger(const SessionLogSource *source);

    QList<ConversationMessage> mergeTimeline(const QStringList &sessionIds) const;

    /**
     * Pick the team label for a subagent log: correlated Task description,
     * then a label embedded in the subagent log, then "Agent <id>".
     */
    static QString subagentLabel(const QString &agentId, const QHash<QString, QString> &correlated, const QList<SessionLogRecord> &subagentRecords);

    /**
     * Stable sort by timestamp. Messages without a parseable timestamp keep
     * the key of the closest earlier message so they stay beside it.
     */
    static void sortByTimestamp(QList<ConversationMessage> &messages);

private:
    const SessionLogSource *m_source = nullptr;
};

} // namespace Callboard

#endif // TIMELINEMERGER_H
