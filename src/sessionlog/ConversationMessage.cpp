/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ConversationMessage.h"

namespace Callboard
{

QJsonObject TokenUsage::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("input_tokens")] = static_cast<qint64>(inputTokens);
    obj[QStringLiteral("output_tokens")] = static_cast<qint64>(outputTokens);
    obj[QStringLiteral("cache_creation_input_tokens")] = static_cast<qint64>(cacheCreationTokens);
    obj[QStringLiteral("cache_read_input_tokens")] = static_cast<qint64>(cacheReadTokens);
    return obj;
}

QJsonObject MessageMetadata::toJson() const
{
    QJsonObject obj;
    if (!model.isEmpty()) {
        obj[QStringLiteral("model")] = model;
    }
    if (!gitBranch.isEmpty()) {
        obj[QStringLiteral("gitBranch")] = gitBranch;
    }
    if (hasUsage) {
        obj[QStringLiteral("usage")] = usage.toJson();
    }
    if (!serviceTier.isEmpty()) {
        obj[QStringLiteral("serviceTier")] = serviceTier;
    }
    return obj;
}

QJsonObject ConversationMessage::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("role")] = roleToString(role);
    obj[QStringLiteral("type")] = typeToString(type);
    obj[QStringLiteral("content")] = content;
    if (!timestamp.isEmpty()) {
        obj[QStringLiteral("timestamp")] = timestamp;
    }
    if (!toolName.isEmpty()) {
        obj[QStringLiteral("toolName")] = toolName;
    }
    if (!toolId.isEmpty()) {
        obj[QStringLiteral("toolId")] = toolId;
    }
    if (!teamName.isEmpty()) {
        obj[QStringLiteral("teamName")] = teamName;
    }
    if (!metadata.isEmpty()) {
        obj[QStringLiteral("metadata")] = metadata.toJson();
    }
    return obj;
}

QString ConversationMessage::roleToString(Role role)
{
    switch (role) {
    case Role::User:
        return QStringLiteral("user");
    case Role::Assistant:
        return QStringLiteral("assistant");
    case Role::System:
        return QStringLiteral("system");
    }
    return QString();
}

QString ConversationMessage::typeToString(Type type)
{
    switch (type) {
    case Type::Text:
        return QStringLiteral("text");
    case Type::Thinking:
        return QStringLiteral("thinking");
    case Type::ToolUse:
        return QStringLiteral("tool_use");
    case Type::ToolResult:
        return QStringLiteral("tool_result");
    case Type::SystemMarker:
        return QStringLiteral("system");
    }
    return QString();
}

} // namespace Callboard
