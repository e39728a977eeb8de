/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SUBAGENTCORRELATOR_H
#define SUBAGENTCORRELATOR_H

#include "callboard_export.h"

#include "SessionLogRecord.h"

#include <QHash>
#include <QList>
#include <QString>

namespace Callboard
{

/**
 * SubagentCorrelator maps spawned subagent ids to readable labels.
 *
 * A Task tool_use block carries input.description; the record holding the
 * spawn result carries toolUseResult.agentId plus a tool_result block that
 * answers the Task invocation. Joining the two gives agentId -> description.
 *
 * Descriptions are collected over the whole record list before results are
 * resolved, so a result logged ahead of its invocation still correlates.
 */
class CALLBOARD_EXPORT SubagentCorrelator
{
public:
    static QHash<QString, QString> correlate(const QList<SessionLogRecord> &records);

    /**
     * Label used when no description is known: "Agent <id>"
     */
    static QString fallbackLabel(const QString &agentId);

    static constexpr const char *TaskToolName = "Task";
};

} // namespace Callboard

#endif // SUBAGENTCORRELATOR_H
