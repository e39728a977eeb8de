/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONLOGSOURCE_H
#define SESSIONLOGSOURCE_H

#include "callboard_export.h"

#include <QList>
#include <QString>

namespace Callboard
{

/**
 * A subagent log belonging to a parent session
 */
struct CALLBOARD_EXPORT SubagentLogFile {
    QString agentId;
    QString path;
};

/**
 * SessionLogSource locates log files for session ids.
 *
 * SessionLogStore implements it over the on-disk project layout; tests
 * substitute their own.
 */
class CALLBOARD_EXPORT SessionLogSource
{
public:
    virtual ~SessionLogSource() = default;

    /**
     * Path of the log for @p sessionId, or a null string if there is none
     */
    virtual QString findLogFileForSession(const QString &sessionId) const = 0;

    /**
     * Subagent logs spawned from @p sessionId, empty if there are none
     */
    virtual QList<SubagentLogFile> findSubagentLogFiles(const QString &sessionId) const = 0;
};

} // namespace Callboard

#endif // SESSIONLOGSOURCE_H
