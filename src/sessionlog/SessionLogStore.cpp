/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionLogStore.h"

#include "ChatFileStore.h"
#include "SessionLogRecord.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>

#include <algorithm>

namespace Callboard
{

namespace
{
const QString LogSuffix = QStringLiteral(".jsonl");
const QString SubagentPrefix = QStringLiteral("agent-");

// Text a user actually typed, or empty for meta and tool-result-only records
QString userText(const SessionLogRecord &record)
{
    if (record.kind != RecordKind::UserMessage || record.isMeta) {
        return QString();
    }

    if (record.hasStringContent) {
        return record.textContent.trimmed();
    }

    for (const ContentBlock &block : record.blocks) {
        if (block.type == ContentBlock::Type::Text && !block.text.trimmed().isEmpty()) {
            return block.text.trimmed();
        }
    }
    return QString();
}
}

QJsonObject ChatLookup::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("id")] = id;
    obj[QStringLiteral("folder")] = folder;
    obj[QStringLiteral("original_folder")] = originalFolder;
    obj[QStringLiteral("session_id")] = sessionId;
    obj[QStringLiteral("session_ids")] = QJsonArray::fromStringList(sessionIds);
    obj[QStringLiteral("session_log_path")] = logPath.isNull() ? QJsonValue(QJsonValue::Null) : QJsonValue(logPath);
    obj[QStringLiteral("metadata")] = metadata;
    obj[QStringLiteral("created_at")] = createdAt;
    obj[QStringLiteral("updated_at")] = updatedAt;
    if (hasStatus) {
        obj[QStringLiteral("is_git_repo")] = status.isRepo;
        if (status.isRepo) {
            obj[QStringLiteral("git_branch")] = status.branch;
        }
    }
    if (fromFilesystem) {
        obj[QStringLiteral("from_filesystem")] = true;
    }
    return obj;
}

SessionLogStore::SessionLogStore(const QString &root, const RepositoryInspector *inspector, SessionLocator::StrategyMode mode, qint64 statusTtlMs)
    : m_root(QDir::cleanPath(root))
    , m_ownedInspector(inspector ? std::unique_ptr<GitRepositoryInspector>() : std::make_unique<GitRepositoryInspector>())
    , m_inspector(inspector ? inspector : m_ownedInspector.get())
    , m_resolver(m_inspector)
    , m_statusCache(m_inspector, statusTtlMs)
    , m_locator(m_root, &m_resolver, mode)
    , m_merger(this)
{
}

SessionLogStore::~SessionLogStore() = default;

void SessionLogStore::setChatStore(const ChatFileStore *chats)
{
    m_chats = chats;
}

QString SessionLogStore::findLogFileForSession(const QString &sessionId) const
{
    if (sessionId.isEmpty() || sessionId.contains(QLatin1Char('/'))) {
        return QString();
    }

    QDir rootDir(m_root);
    if (!rootDir.exists()) {
        return QString();
    }

    const QString fileName = sessionId + LogSuffix;
    const QStringList projectDirs = rootDir.entryList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden, QDir::Name);
    for (const QString &projectDir : projectDirs) {
        const QString candidate = rootDir.filePath(projectDir + QLatin1Char('/') + fileName);
        if (QFileInfo(candidate).isFile()) {
            return candidate;
        }
    }

    return QString();
}

QList<SubagentLogFile> SessionLogStore::findSubagentLogFiles(const QString &sessionId) const
{
    const QString logPath = findLogFileForSession(sessionId);
    if (logPath.isEmpty()) {
        return {};
    }

    // <project>/<session>.jsonl -> <project>/<session>/subagents/
    QDir subagentDir(logPath.left(logPath.size() - LogSuffix.size()) + QStringLiteral("/subagents"));
    if (!subagentDir.exists()) {
        return {};
    }

    QList<SubagentLogFile> files;
    const QStringList names = subagentDir.entryList({SubagentPrefix + QStringLiteral("*") + LogSuffix}, QDir::Files, QDir::Name);
    for (const QString &name : names) {
        SubagentLogFile file;
        file.agentId = name.mid(SubagentPrefix.size(), name.size() - SubagentPrefix.size() - LogSuffix.size());
        file.path = subagentDir.filePath(name);
        if (!file.agentId.isEmpty()) {
            files.append(file);
        }
    }
    return files;
}

SessionPage SessionLogStore::listSessions(int limit, int offset) const
{
    return m_locator.listSessions(limit, offset);
}

QList<ConversationMessage> SessionLogStore::conversationTimeline(const QStringList &sessionIds) const
{
    return m_merger.mergeTimeline(sessionIds);
}

QString SessionLogStore::truncatePreview(const QString &text, int maxChars)
{
    if (maxChars <= 0 || text.size() <= maxChars) {
        return text;
    }
    int cut = std::max(0, maxChars - 3);
    // Never split a surrogate pair
    if (cut > 0 && text.at(cut - 1).isHighSurrogate()) {
        --cut;
    }
    return text.left(cut) + QStringLiteral("...");
}

QString SessionLogStore::preview(const QString &logPath, int maxChars) const
{
    QFile file(logPath);
    if (!file.exists()) {
        return QString();
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "SessionLogStore: Cannot open" << logPath << "-" << file.errorString();
        return QString();
    }

    // Stop at the first user text; no need to decode the rest of the log
    while (!file.atEnd()) {
        bool ok = false;
        const SessionLogRecord record = SessionLogDecoder::decodeLine(file.readLine(), &ok);
        if (!ok) {
            continue;
        }

        const QString text = userText(record);
        if (!text.isEmpty()) {
            return truncatePreview(text, maxChars);
        }
    }

    return QString();
}

RepositoryStatus SessionLogStore::directoryStatus(const QString &path)
{
    return m_statusCache.status(path);
}

ChatLookup SessionLogStore::findChat(const QString &id, bool includeStatus)
{
    ChatLookup lookup;
    if (id.isEmpty()) {
        return lookup;
    }

    const ChatRecord chat = m_chats ? m_chats->chat(id) : ChatRecord();
    if (chat.isValid()) {
        lookup.id = chat.id;
        lookup.originalFolder = chat.folder;
        lookup.folder = m_resolver.mainRepoPath(chat.folder);
        lookup.sessionId = chat.sessionId;
        lookup.sessionIds = chat.sessionIds();
        lookup.logPath = findLogFileForSession(chat.sessionId);
        lookup.metadata = chat.metadata;
        lookup.createdAt = chat.createdAt;
        lookup.updatedAt = chat.updatedAt;
    } else {
        // Sessions started outside Callboard have no chat record
        const QString logPath = findLogFileForSession(id);
        if (logPath.isEmpty()) {
            return lookup;
        }

        const SessionDescriptor descriptor = m_locator.describe(logPath);
        lookup.id = id;
        lookup.originalFolder = descriptor.folder;
        lookup.folder = descriptor.displayFolder;
        lookup.sessionId = id;
        lookup.sessionIds = QStringList{id};
        lookup.logPath = logPath;
        QJsonObject metadata;
        metadata[QStringLiteral("session_ids")] = QJsonArray{id};
        lookup.metadata = QString::fromUtf8(QJsonDocument(metadata).toJson(QJsonDocument::Compact));
        lookup.createdAt = descriptor.created.toUTC().toString(Qt::ISODateWithMs);
        lookup.updatedAt = descriptor.modified.toUTC().toString(Qt::ISODateWithMs);
        lookup.fromFilesystem = true;
    }

    if (includeStatus) {
        // The original folder carries the worktree's own branch
        lookup.status = directoryStatus(lookup.originalFolder);
        lookup.hasStatus = true;
    }

    return lookup;
}

} // namespace Callboard
