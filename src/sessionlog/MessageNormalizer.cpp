/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "MessageNormalizer.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace Callboard
{

static ConversationMessage::Role roleForRecord(const SessionLogRecord &record)
{
    if (record.kind == RecordKind::AssistantMessage) {
        return ConversationMessage::Role::Assistant;
    }
    return ConversationMessage::Role::User;
}

QString MessageNormalizer::serializeJson(const QJsonValue &value)
{
    if (value.isObject()) {
        return QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
    }
    if (value.isArray()) {
        return QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
    }
    if (value.isUndefined()) {
        return QString();
    }

    // QJsonDocument only holds containers; wrap the scalar and strip the brackets
    const QString wrapped = QString::fromUtf8(QJsonDocument(QJsonArray{value}).toJson(QJsonDocument::Compact));
    return wrapped.mid(1, wrapped.size() - 2);
}

QString MessageNormalizer::flattenToolResult(const QJsonValue &content)
{
    if (content.isString()) {
        return content.toString();
    }
    if (content.isNull() || content.isUndefined()) {
        return QString();
    }
    if (!content.isArray()) {
        return serializeJson(content);
    }

    QStringList parts;
    const QJsonArray items = content.toArray();
    for (const QJsonValue &item : items) {
        const QJsonObject obj = item.toObject();
        if (item.isObject() && obj.value(QStringLiteral("type")).toString() == QLatin1String("text")) {
            parts.append(obj.value(QStringLiteral("text")).toString());
        } else {
            parts.append(serializeJson(item));
        }
    }
    return parts.join(QLatin1Char('\n'));
}

QList<ConversationMessage> MessageNormalizer::normalizeRecord(const SessionLogRecord &record, const QString &teamName)
{
    QList<ConversationMessage> result;

    auto makeMessage = [&record, &teamName](ConversationMessage::Role role, ConversationMessage::Type type, const QString &content) {
        ConversationMessage message;
        message.role = role;
        message.type = type;
        message.content = content;
        message.timestamp = record.timestamp;
        message.teamName = teamName;
        message.metadata = record.metadata();
        return message;
    };

    switch (record.kind) {
    case RecordKind::Summary:
    case RecordKind::QueueOperation:
    case RecordKind::Unknown:
        return result;
    case RecordKind::SystemMarker:
        if (record.subtype == QLatin1String(CompactBoundarySubtype)) {
            const QString content = record.textContent.isEmpty() ? record.subtype : record.textContent;
            result.append(makeMessage(ConversationMessage::Role::System, ConversationMessage::Type::SystemMarker, content));
        }
        return result;
    case RecordKind::UserMessage:
    case RecordKind::AssistantMessage:
        break;
    }

    const ConversationMessage::Role role = roleForRecord(record);

    if (record.hasStringContent) {
        if (!record.textContent.isEmpty()) {
            result.append(makeMessage(role, ConversationMessage::Type::Text, record.textContent));
        }
        return result;
    }

    for (const ContentBlock &block : record.blocks) {
        switch (block.type) {
        case ContentBlock::Type::Text:
            if (!block.text.isEmpty()) {
                result.append(makeMessage(role, ConversationMessage::Type::Text, block.text));
            }
            break;
        case ContentBlock::Type::Thinking:
            if (!block.text.isEmpty()) {
                result.append(makeMessage(ConversationMessage::Role::Assistant, ConversationMessage::Type::Thinking, block.text));
            }
            break;
        case ContentBlock::Type::ToolUse: {
            QString input = serializeJson(block.input);
            if (input.isEmpty()) {
                input = QStringLiteral("{}");
            }
            ConversationMessage message = makeMessage(ConversationMessage::Role::Assistant, ConversationMessage::Type::ToolUse, input);
            message.toolName = block.toolName;
            message.toolId = block.toolUseId;
            result.append(message);
            break;
        }
        case ContentBlock::Type::ToolResult: {
            const QString content = flattenToolResult(block.resultContent);
            if (content.isEmpty()) {
                break;
            }
            ConversationMessage message = makeMessage(ConversationMessage::Role::Assistant, ConversationMessage::Type::ToolResult, content);
            // The answered invocation id doubles as the display name
            message.toolName = block.toolUseId;
            message.toolId = block.toolUseId;
            result.append(message);
            break;
        }
        case ContentBlock::Type::Other:
            break;
        }
    }

    return result;
}

QList<ConversationMessage> MessageNormalizer::normalize(const QList<SessionLogRecord> &records, const QString &teamName)
{
    QList<ConversationMessage> result;
    for (const SessionLogRecord &record : records) {
        result.append(normalizeRecord(record, teamName));
    }
    return result;
}

} // namespace Callboard
