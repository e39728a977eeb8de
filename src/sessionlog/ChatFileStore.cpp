/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ChatFileStore.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSet>

#include <algorithm>

namespace Callboard
{

static QString currentTimestamp()
{
    return QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
}

static qint64 timestampToMSecs(const QString &timestamp)
{
    const QDateTime parsed = QDateTime::fromString(timestamp, Qt::ISODateWithMs);
    return parsed.isValid() ? parsed.toMSecsSinceEpoch() : 0;
}

QJsonObject ChatRecord::metadataObject() const
{
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(metadata.toUtf8(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        return QJsonObject();
    }
    return doc.object();
}

QStringList ChatRecord::sessionIds() const
{
    QStringList ids;
    QSet<QString> seen;

    const QJsonArray stored = metadataObject().value(QStringLiteral("session_ids")).toArray();
    for (const QJsonValue &value : stored) {
        const QString id = value.toString();
        if (!id.isEmpty() && !seen.contains(id)) {
            seen.insert(id);
            ids.append(id);
        }
    }

    if (ids.isEmpty() && !sessionId.isEmpty()) {
        ids.append(sessionId);
    }
    return ids;
}

QJsonObject ChatRecord::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("id")] = id;
    obj[QStringLiteral("folder")] = folder;
    obj[QStringLiteral("session_id")] = sessionId;
    obj[QStringLiteral("metadata")] = metadata;
    obj[QStringLiteral("created_at")] = createdAt;
    obj[QStringLiteral("updated_at")] = updatedAt;
    return obj;
}

ChatRecord ChatRecord::fromJson(const QJsonObject &obj)
{
    ChatRecord chat;
    chat.id = obj.value(QStringLiteral("id")).toString();
    chat.folder = obj.value(QStringLiteral("folder")).toString();
    chat.sessionId = obj.value(QStringLiteral("session_id")).toString();
    // Older files stored metadata as an object
    const QJsonValue metadata = obj.value(QStringLiteral("metadata"));
    if (metadata.isObject()) {
        chat.metadata = QString::fromUtf8(QJsonDocument(metadata.toObject()).toJson(QJsonDocument::Compact));
    } else if (metadata.isString()) {
        chat.metadata = metadata.toString();
    }
    chat.createdAt = obj.value(QStringLiteral("created_at")).toString();
    chat.updatedAt = obj.value(QStringLiteral("updated_at")).toString();
    return chat;
}

ChatFileStore::ChatFileStore(const QString &dataDirectory)
    : m_dataDirectory(dataDirectory)
{
}

QString ChatFileStore::chatsDirectory() const
{
    return QDir(m_dataDirectory).filePath(QStringLiteral("chats"));
}

QString ChatFileStore::chatFilePath(const QString &sessionId) const
{
    return QDir(chatsDirectory()).filePath(sessionId + QStringLiteral(".json"));
}

ChatRecord ChatFileStore::readChatFile(const QString &path, bool *ok)
{
    if (ok) *ok = false;

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "ChatFileStore: Cannot open" << path << "-" << file.errorString();
        return ChatRecord();
    }

    const QByteArray data = file.readAll();
    file.close();

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "ChatFileStore: Malformed chat file" << path << "-" << error.errorString();
        return ChatRecord();
    }

    if (ok) *ok = true;
    return ChatRecord::fromJson(doc.object());
}

bool ChatFileStore::saveChat(const ChatRecord &chat) const
{
    if (!QDir().mkpath(chatsDirectory())) {
        qWarning() << "ChatFileStore: Cannot create" << chatsDirectory();
        return false;
    }

    QFile file(chatFilePath(chat.sessionId));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "ChatFileStore: Cannot write" << file.fileName() << "-" << file.errorString();
        return false;
    }

    file.write(QJsonDocument(chat.toJson()).toJson(QJsonDocument::Indented));
    file.close();
    return true;
}

QList<ChatRecord> ChatFileStore::allChats(int limit, int offset) const
{
    QDir dir(chatsDirectory());
    if (!dir.exists()) {
        return {};
    }

    QList<ChatRecord> chats;
    const QStringList files = dir.entryList({QStringLiteral("*.json")}, QDir::Files, QDir::Name);
    for (const QString &fileName : files) {
        bool ok = false;
        const ChatRecord chat = readChatFile(dir.filePath(fileName), &ok);
        if (ok) {
            chats.append(chat);
        }
    }

    std::stable_sort(chats.begin(), chats.end(), [](const ChatRecord &a, const ChatRecord &b) {
        return timestampToMSecs(a.updatedAt) > timestampToMSecs(b.updatedAt);
    });

    const int start = std::max(0, offset);
    if (start >= chats.size()) {
        return {};
    }
    return chats.mid(start, limit < 0 ? -1 : limit);
}

ChatRecord ChatFileStore::chat(const QString &id) const
{
    if (id.isEmpty() || id.contains(QLatin1Char('/'))) {
        return ChatRecord();
    }

    const QString sessionPath = chatFilePath(id);
    if (QFileInfo::exists(sessionPath)) {
        bool ok = false;
        const ChatRecord chat = readChatFile(sessionPath, &ok);
        if (ok) {
            return chat;
        }
    }

    QDir dir(chatsDirectory());
    const QStringList files = dir.entryList({QStringLiteral("*.json")}, QDir::Files, QDir::Name);
    for (const QString &fileName : files) {
        bool ok = false;
        const ChatRecord chat = readChatFile(dir.filePath(fileName), &ok);
        if (ok && chat.id == id) {
            return chat;
        }
    }

    return ChatRecord();
}

ChatRecord ChatFileStore::upsertChat(const QString &id, const QString &folder, const QString &sessionId, const QString &metadata, bool *ok)
{
    if (ok) *ok = false;

    ChatRecord chat = this->chat(id);
    const QString now = currentTimestamp();

    if (chat.isValid()) {
        const QString oldSessionId = chat.sessionId;
        if (!folder.isEmpty()) {
            chat.folder = folder;
        }
        if (!metadata.isEmpty()) {
            chat.metadata = metadata;
        }
        if (!sessionId.isEmpty()) {
            chat.sessionId = sessionId;
        }
        chat.updatedAt = now;

        if (chat.sessionId != oldSessionId) {
            removeChat(oldSessionId);
        }
    } else {
        chat = ChatRecord();
        chat.id = id;
        chat.folder = folder;
        chat.sessionId = sessionId;
        if (!metadata.isEmpty()) {
            chat.metadata = metadata;
        }
        chat.createdAt = now;
        chat.updatedAt = now;
    }

    if (!chat.isValid()) {
        qWarning() << "ChatFileStore: Refusing to store chat without id or session id";
        return ChatRecord();
    }

    const bool saved = saveChat(chat);
    if (ok) *ok = saved;
    return chat;
}

bool ChatFileStore::updateChatMetadata(const QString &id, const QJsonObject &fields)
{
    ChatRecord chat = this->chat(id);
    if (!chat.isValid()) {
        return false;
    }

    QJsonObject merged = chat.metadataObject();
    for (auto it = fields.constBegin(); it != fields.constEnd(); ++it) {
        merged.insert(it.key(), it.value());
    }

    chat.metadata = QString::fromUtf8(QJsonDocument(merged).toJson(QJsonDocument::Compact));
    chat.updatedAt = currentTimestamp();
    return saveChat(chat);
}

bool ChatFileStore::removeChat(const QString &sessionId)
{
    if (sessionId.isEmpty()) {
        return false;
    }

    QFile file(chatFilePath(sessionId));
    if (!file.exists()) {
        return false;
    }

    if (!file.remove()) {
        qWarning() << "ChatFileStore: Cannot delete" << file.fileName() << "-" << file.errorString();
        return false;
    }
    return true;
}

} // namespace Callboard
