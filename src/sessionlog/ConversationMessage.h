/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef CONVERSATIONMESSAGE_H
#define CONVERSATIONMESSAGE_H

#include "callboard_export.h"

#include <QJsonObject>
#include <QString>

namespace Callboard
{

/**
 * Token counters reported on an assistant record
 */
struct CALLBOARD_EXPORT TokenUsage {
    quint64 inputTokens = 0;
    quint64 outputTokens = 0;
    quint64 cacheReadTokens = 0;
    quint64 cacheCreationTokens = 0;

    quint64 totalTokens() const
    {
        return inputTokens + outputTokens + cacheReadTokens + cacheCreationTokens;
    }

    bool operator==(const TokenUsage &other) const
    {
        return inputTokens == other.inputTokens && outputTokens == other.outputTokens && cacheReadTokens == other.cacheReadTokens
            && cacheCreationTokens == other.cacheCreationTokens;
    }

    QJsonObject toJson() const;
};

/**
 * Per-record metadata attached to each message block it produced
 */
struct CALLBOARD_EXPORT MessageMetadata {
    QString model;
    QString gitBranch;
    QString serviceTier;
    TokenUsage usage;
    bool hasUsage = false;

    bool isEmpty() const
    {
        return model.isEmpty() && gitBranch.isEmpty() && serviceTier.isEmpty() && !hasUsage;
    }

    bool operator==(const MessageMetadata &other) const
    {
        return model == other.model && gitBranch == other.gitBranch && serviceTier == other.serviceTier && hasUsage == other.hasUsage
            && usage == other.usage;
    }

    QJsonObject toJson() const;
};

/**
 * ConversationMessage is the flattened, display-ready unit produced from
 * session logs. Text, thinking and tool messages always carry non-empty
 * content.
 */
struct CALLBOARD_EXPORT ConversationMessage {
    enum class Role {
        User,
        Assistant,
        System,
    };

    enum class Type {
        Text,
        Thinking,
        ToolUse,
        ToolResult,
        SystemMarker,
    };

    Role role = Role::User;
    Type type = Type::Text;
    QString content;
    QString timestamp;
    QString toolName;
    QString toolId;
    QString teamName; // set on messages that came from a subagent log
    MessageMetadata metadata;

    QJsonObject toJson() const;

    static QString roleToString(Role role);
    static QString typeToString(Type type);
};

} // namespace Callboard

#endif // CONVERSATIONMESSAGE_H
