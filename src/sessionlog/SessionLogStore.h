/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONLOGSTORE_H
#define SESSIONLOGSTORE_H

#include "callboard_export.h"

#include "ConversationMessage.h"
#include "DirectoryStatusCache.h"
#include "RepositoryInspector.h"
#include "SessionLocator.h"
#include "SessionLogSource.h"
#include "TimelineMerger.h"
#include "WorktreeResolver.h"

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

#include <memory>

namespace Callboard
{

class ChatFileStore;

/**
 * Result of looking up a chat by id
 */
struct CALLBOARD_EXPORT ChatLookup {
    QString id;
    QString folder; // main checkout, for display
    QString originalFolder; // as recorded, may be a worktree
    QString sessionId;
    QStringList sessionIds;
    QString logPath; // null if the current session has no log yet
    QString metadata;
    QString createdAt;
    QString updatedAt;
    bool fromFilesystem = false;

    bool hasStatus = false;
    RepositoryStatus status;

    bool isValid() const
    {
        return !id.isEmpty();
    }

    QJsonObject toJson() const;
};

/**
 * SessionLogStore is the read side of the session log store rooted at
 * "<root>/<encoded-cwd>/<session>.jsonl".
 *
 * It lists and pages sessions, builds conversation timelines across
 * resumed sessions and their subagents, extracts previews, and answers
 * cached repository status questions for working directories.
 */
class CALLBOARD_EXPORT SessionLogStore : public SessionLogSource
{
public:
    /**
     * @p inspector may be null, in which case a GitRepositoryInspector is used.
     * It must outlive the store.
     */
    explicit SessionLogStore(const QString &root,
                             const RepositoryInspector *inspector = nullptr,
                             SessionLocator::StrategyMode mode = SessionLocator::StrategyMode::Auto,
                             qint64 statusTtlMs = DirectoryStatusCache::DefaultTtlMs);
    ~SessionLogStore() override;

    QString root() const { return m_root; }

    /**
     * Chat records consulted by findChat(), not owned
     */
    void setChatStore(const ChatFileStore *chats);

    // SessionLogSource
    QString findLogFileForSession(const QString &sessionId) const override;
    QList<SubagentLogFile> findSubagentLogFiles(const QString &sessionId) const override;

    SessionPage listSessions(int limit, int offset) const;

    QList<ConversationMessage> conversationTimeline(const QStringList &sessionIds) const;

    /**
     * First user-authored text of a log, cut to @p maxChars with "...".
     * Null if the file is missing or has no user text.
     */
    QString preview(const QString &logPath, int maxChars) const;

    RepositoryStatus directoryStatus(const QString &path);

    /**
     * Resolve a chat id through the chat store, then as a bare session id
     */
    ChatLookup findChat(const QString &id, bool includeStatus = true);

    static QString truncatePreview(const QString &text, int maxChars);

    static constexpr int DefaultPreviewLength = 120;

private:
    QString m_root;
    std::unique_ptr<GitRepositoryInspector> m_ownedInspector;
    const RepositoryInspector *m_inspector = nullptr;
    const ChatFileStore *m_chats = nullptr;

    WorktreeResolver m_resolver;
    DirectoryStatusCache m_statusCache;
    SessionLocator m_locator;
    TimelineMerger m_merger;
};

} // namespace Callboard

#endif // SESSIONLOGSTORE_H
