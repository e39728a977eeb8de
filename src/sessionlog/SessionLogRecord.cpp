/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionLogRecord.h"

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>

namespace Callboard
{

// Negative or non-integral counts read as zero
static quint64 tokenCount(const QJsonValue &value)
{
    const qint64 count = value.toInteger();
    return count > 0 ? static_cast<quint64>(count) : 0;
}

MessageMetadata SessionLogRecord::metadata() const
{
    MessageMetadata meta;
    meta.model = model;
    meta.gitBranch = gitBranch;
    meta.serviceTier = serviceTier;
    meta.usage = usage;
    meta.hasUsage = hasUsage;
    return meta;
}

RecordKind SessionLogDecoder::kindFromString(const QString &type)
{
    if (type == QLatin1String("user")) {
        return RecordKind::UserMessage;
    }
    if (type == QLatin1String("assistant")) {
        return RecordKind::AssistantMessage;
    }
    if (type == QLatin1String("system")) {
        return RecordKind::SystemMarker;
    }
    if (type == QLatin1String("summary")) {
        return RecordKind::Summary;
    }
    if (type == QLatin1String("queue-operation")) {
        return RecordKind::QueueOperation;
    }
    return RecordKind::Unknown;
}

ContentBlock SessionLogDecoder::decodeBlock(const QJsonObject &obj)
{
    ContentBlock block;
    const QString type = obj.value(QStringLiteral("type")).toString();

    if (type == QLatin1String("text")) {
        block.type = ContentBlock::Type::Text;
        block.text = obj.value(QStringLiteral("text")).toString();
    } else if (type == QLatin1String("thinking")) {
        block.type = ContentBlock::Type::Thinking;
        block.text = obj.value(QStringLiteral("thinking")).toString();
    } else if (type == QLatin1String("tool_use")) {
        block.type = ContentBlock::Type::ToolUse;
        block.toolName = obj.value(QStringLiteral("name")).toString();
        block.toolUseId = obj.value(QStringLiteral("id")).toString();
        block.input = obj.value(QStringLiteral("input"));
    } else if (type == QLatin1String("tool_result")) {
        block.type = ContentBlock::Type::ToolResult;
        block.toolUseId = obj.value(QStringLiteral("tool_use_id")).toString();
        block.resultContent = obj.value(QStringLiteral("content"));
    }

    return block;
}

SessionLogRecord SessionLogDecoder::decodeLine(const QByteArray &line, bool *ok)
{
    SessionLogRecord record;
    if (ok) {
        *ok = false;
    }

    const QByteArray trimmed = line.trimmed();
    if (trimmed.isEmpty()) {
        return record;
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(trimmed, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        return record;
    }

    if (ok) {
        *ok = true;
    }

    const QJsonObject obj = doc.object();
    const QJsonObject message = obj.value(QStringLiteral("message")).toObject();

    record.kind = kindFromString(obj.value(QStringLiteral("type")).toString());
    record.role = message.value(QStringLiteral("role")).toString();

    // Bare role records without a "type" field
    if (record.kind == RecordKind::Unknown && !obj.contains(QStringLiteral("type"))) {
        const QString role = record.role.isEmpty() ? obj.value(QStringLiteral("role")).toString() : record.role;
        if (role == QLatin1String("user")) {
            record.kind = RecordKind::UserMessage;
        } else if (role == QLatin1String("assistant")) {
            record.kind = RecordKind::AssistantMessage;
        }
    }

    if (record.role.isEmpty()) {
        if (record.kind == RecordKind::UserMessage) {
            record.role = QStringLiteral("user");
        } else if (record.kind == RecordKind::AssistantMessage) {
            record.role = QStringLiteral("assistant");
        }
    }

    record.subtype = obj.value(QStringLiteral("subtype")).toString();
    record.timestamp = obj.value(QStringLiteral("timestamp")).toString();
    record.sessionId = obj.value(QStringLiteral("sessionId")).toString();
    record.uuid = obj.value(QStringLiteral("uuid")).toString();
    record.gitBranch = obj.value(QStringLiteral("gitBranch")).toString();
    record.isMeta = obj.value(QStringLiteral("isMeta")).toBool();
    record.isSidechain = obj.value(QStringLiteral("isSidechain")).toBool();

    QJsonValue content = message.value(QStringLiteral("content"));
    if (content.isUndefined() || content.isNull()) {
        content = obj.value(QStringLiteral("content"));
    }
    if (content.isString()) {
        record.hasStringContent = true;
        record.textContent = content.toString();
    } else if (content.isArray()) {
        const QJsonArray blocks = content.toArray();
        for (const QJsonValue &value : blocks) {
            if (value.isObject()) {
                record.blocks.append(decodeBlock(value.toObject()));
            }
        }
    }

    record.model = message.value(QStringLiteral("model")).toString();

    const QJsonObject usageObj = message.value(QStringLiteral("usage")).toObject();
    if (!usageObj.isEmpty()) {
        record.hasUsage = true;
        record.usage.inputTokens = tokenCount(usageObj.value(QStringLiteral("input_tokens")));
        record.usage.outputTokens = tokenCount(usageObj.value(QStringLiteral("output_tokens")));
        record.usage.cacheCreationTokens = tokenCount(usageObj.value(QStringLiteral("cache_creation_input_tokens")));
        record.usage.cacheReadTokens = tokenCount(usageObj.value(QStringLiteral("cache_read_input_tokens")));
        record.serviceTier = usageObj.value(QStringLiteral("service_tier")).toString();
    }

    const QJsonValue toolUseResult = obj.value(QStringLiteral("toolUseResult"));
    if (toolUseResult.isObject()) {
        record.agentId = toolUseResult.toObject().value(QStringLiteral("agentId")).toString();
    }

    record.embeddedAgentLabel = obj.value(QStringLiteral("agentName")).toString();
    if (record.embeddedAgentLabel.isEmpty()) {
        record.embeddedAgentLabel = obj.value(QStringLiteral("teamName")).toString();
    }

    return record;
}

QList<SessionLogRecord> SessionLogDecoder::decodeLines(const QByteArray &data)
{
    QList<SessionLogRecord> records;

    const QList<QByteArray> lines = data.split('\n');
    for (const QByteArray &line : lines) {
        SessionLogRecord record = decodeLine(line);
        if (record.kind != RecordKind::Unknown) {
            records.append(std::move(record));
        }
    }

    return records;
}

QList<SessionLogRecord> SessionLogDecoder::readFile(const QString &path)
{
    QList<SessionLogRecord> records;
    if (path.isEmpty()) {
        return records;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (file.exists()) {
            qWarning() << "SessionLogDecoder: Cannot open" << path << "-" << file.errorString();
        }
        return records;
    }

    // A partially written trailing line fails to decode and is skipped
    while (!file.atEnd()) {
        SessionLogRecord record = decodeLine(file.readLine());
        if (record.kind != RecordKind::Unknown) {
            records.append(std::move(record));
        }
    }

    return records;
}

} // namespace Callboard
