/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONLOGRECORD_H
#define SESSIONLOGRECORD_H

#include "callboard_export.h"

#include "ConversationMessage.h"

#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QString>

namespace Callboard
{

/**
 * Kind of a decoded log line, taken from its "type" field
 */
enum class RecordKind {
    UserMessage,
    AssistantMessage,
    SystemMarker,
    Summary,
    QueueOperation,
    Unknown,
};

/**
 * One entry of a message's content block list
 */
struct CALLBOARD_EXPORT ContentBlock {
    enum class Type {
        Text,
        Thinking,
        ToolUse,
        ToolResult,
        Other,
    };

    Type type = Type::Other;

    QString text; // Text and Thinking
    QString toolName; // ToolUse
    QString toolUseId; // ToolUse: own id, ToolResult: id of the invocation it answers
    QJsonValue input; // ToolUse payload
    QJsonValue resultContent; // ToolResult payload (string or list of sub-blocks)
};

/**
 * SessionLogRecord is one decoded line of a session log.
 *
 * Message content is either a plain string (hasStringContent) or a list of
 * blocks. Per-record metadata (model, branch, usage) is copied onto every
 * message the record produces.
 */
struct CALLBOARD_EXPORT SessionLogRecord {
    RecordKind kind = RecordKind::Unknown;
    QString subtype; // system records only
    QString role;

    bool hasStringContent = false;
    QString textContent;
    QList<ContentBlock> blocks;

    QString timestamp; // raw ISO-8601, parsed only when sorting
    QString sessionId;
    QString uuid;
    QString gitBranch;
    QString model;
    QString serviceTier;
    TokenUsage usage;
    bool hasUsage = false;

    bool isMeta = false;
    bool isSidechain = false;

    QString agentId; // toolUseResult.agentId
    QString embeddedAgentLabel; // agentName / teamName on subagent logs

    bool isMessage() const
    {
        return kind == RecordKind::UserMessage || kind == RecordKind::AssistantMessage;
    }

    /**
     * Metadata bag shared by every message normalized from this record
     */
    MessageMetadata metadata() const;
};

/**
 * SessionLogDecoder turns raw log lines into SessionLogRecord values.
 *
 * Decoding never fails hard: a blank or malformed line yields a record of
 * kind Unknown, and file readers skip those and keep going.
 */
class CALLBOARD_EXPORT SessionLogDecoder
{
public:
    /**
     * Decode a single line. @p ok is set to false when the line is blank
     * or is not a JSON object.
     */
    static SessionLogRecord decodeLine(const QByteArray &line, bool *ok = nullptr);

    /**
     * Decode a whole buffer of newline-delimited records, dropping Unknown ones
     */
    static QList<SessionLogRecord> decodeLines(const QByteArray &data);

    /**
     * Read and decode a log file. A missing or unreadable file yields an empty list.
     */
    static QList<SessionLogRecord> readFile(const QString &path);

    static RecordKind kindFromString(const QString &type);

private:
    static ContentBlock decodeBlock(const QJsonObject &obj);
};

} // namespace Callboard

#endif // SESSIONLOGRECORD_H
