/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef CHATFILESTORE_H
#define CHATFILESTORE_H

#include "callboard_export.h"

#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

namespace Callboard
{

/**
 * A chat: the user-facing conversation that ties one or more sessions together
 */
struct CALLBOARD_EXPORT ChatRecord {
    QString id;
    QString folder;
    QString sessionId; // current session, also the file name
    QString metadata = QStringLiteral("{}"); // JSON object text
    QString createdAt; // ISO-8601
    QString updatedAt;

    bool isValid() const
    {
        return !id.isEmpty() && !sessionId.isEmpty();
    }

    /**
     * Parsed metadata, empty if it is not a JSON object
     */
    QJsonObject metadataObject() const;

    /**
     * Ordered, de-duplicated "session_ids" from metadata.
     * Falls back to the chat's own session id.
     */
    QStringList sessionIds() const;

    QJsonObject toJson() const;
    static ChatRecord fromJson(const QJsonObject &obj);
};

/**
 * ChatFileStore keeps chat records as one JSON file per chat under
 * "<dataDirectory>/chats/<session_id>.json".
 *
 * Unreadable files are logged and skipped; no operation throws.
 */
class CALLBOARD_EXPORT ChatFileStore
{
public:
    explicit ChatFileStore(const QString &dataDirectory);

    QString chatsDirectory() const;

    /**
     * Chats ordered by updated_at, newest first. A negative limit means all.
     */
    QList<ChatRecord> allChats(int limit = -1, int offset = 0) const;

    /**
     * Look up by session id (the file name) first, then by chat id.
     * Returns an invalid record if neither matches.
     */
    ChatRecord chat(const QString &id) const;

    /**
     * Update the chat @p id or create it. An existing chat keeps its
     * created_at; a changed session id renames its file.
     * An empty @p metadata leaves existing metadata alone.
     */
    ChatRecord upsertChat(const QString &id, const QString &folder, const QString &sessionId, const QString &metadata = QString(), bool *ok = nullptr);

    /**
     * Merge @p fields into the chat's metadata object
     */
    bool updateChatMetadata(const QString &id, const QJsonObject &fields);

    /**
     * Delete the chat stored under @p sessionId
     */
    bool removeChat(const QString &sessionId);

private:
    QString chatFilePath(const QString &sessionId) const;
    bool saveChat(const ChatRecord &chat) const;
    static ChatRecord readChatFile(const QString &path, bool *ok = nullptr);

    QString m_dataDirectory;
};

} // namespace Callboard

#endif // CHATFILESTORE_H
