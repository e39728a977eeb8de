/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef MESSAGENORMALIZER_H
#define MESSAGENORMALIZER_H

#include "callboard_export.h"

#include "ConversationMessage.h"
#include "SessionLogRecord.h"

#include <QJsonValue>
#include <QList>
#include <QString>

namespace Callboard
{

/**
 * MessageNormalizer flattens decoded log records into ConversationMessage values.
 *
 * - summary and queue-operation records are dropped
 * - a compact_boundary system record becomes one system marker, other system records are dropped
 * - string content becomes one text message
 * - block content becomes one message per non-empty block, in block order;
 *   thinking and tool blocks are always attributed to the assistant
 *
 * Output keeps the input order. An optional team name is stamped on every message.
 */
class CALLBOARD_EXPORT MessageNormalizer
{
public:
    static QList<ConversationMessage> normalize(const QList<SessionLogRecord> &records, const QString &teamName = QString());

    static QList<ConversationMessage> normalizeRecord(const SessionLogRecord &record, const QString &teamName = QString());

    /**
     * Flatten a tool_result payload: strings pass through, lists are joined
     * with newlines using each element's text (or its JSON for non-text elements).
     */
    static QString flattenToolResult(const QJsonValue &content);

    /**
     * Compact JSON for any value, scalars included ("x" -> "\"x\"")
     */
    static QString serializeJson(const QJsonValue &value);

    static constexpr const char *CompactBoundarySubtype = "compact_boundary";
};

} // namespace Callboard

#endif // MESSAGENORMALIZER_H
