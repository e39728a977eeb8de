/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SubagentCorrelator.h"

#include <QJsonObject>

namespace Callboard
{

QString SubagentCorrelator::fallbackLabel(const QString &agentId)
{
    return QStringLiteral("Agent %1").arg(agentId);
}

QHash<QString, QString> SubagentCorrelator::correlate(const QList<SessionLogRecord> &records)
{
    // Pass 1: tool_use id -> Task description
    QHash<QString, QString> descriptions;
    for (const SessionLogRecord &record : records) {
        for (const ContentBlock &block : record.blocks) {
            if (block.type != ContentBlock::Type::ToolUse || block.toolName != QLatin1String(TaskToolName)) {
                continue;
            }
            const QString description = block.input.toObject().value(QStringLiteral("description")).toString();
            if (!block.toolUseId.isEmpty() && !description.isEmpty()) {
                descriptions.insert(block.toolUseId, description);
            }
        }
    }

    // Pass 2: agentId -> label via the tool_result answering the Task call
    QHash<QString, QString> labels;
    for (const SessionLogRecord &record : records) {
        if (record.agentId.isEmpty()) {
            continue;
        }

        QString answeredId;
        for (const ContentBlock &block : record.blocks) {
            if (block.type == ContentBlock::Type::ToolResult) {
                answeredId = block.toolUseId;
                break;
            }
        }

        labels.insert(record.agentId, descriptions.value(answeredId, fallbackLabel(record.agentId)));
    }

    return labels;
}

} // namespace Callboard
