/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "SessionLogStoreTest.h"

// Qt
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QTest>

// Callboard
#include "../sessionlog/ChatFileStore.h"
#include "../sessionlog/ProjectPathCodec.h"
#include "../sessionlog/SessionLogStore.h"

using namespace Callboard;

namespace
{
class StubInspector : public RepositoryInspector
{
public:
    RepositoryStatus repositoryStatus(const QString &directory) const override
    {
        ++statusCalls;
        RepositoryStatus status;
        status.isRepo = directory.startsWith(QStringLiteral("/repos/"));
        if (status.isRepo) {
            status.branch = directory.section(QLatin1Char('/'), -1);
        }
        return status;
    }

    WorktreeResolution resolveWorktree(const QString &directory) const override
    {
        WorktreeResolution resolution;
        resolution.mainRepoPath = directory;
        if (directory == QStringLiteral("/repos/app-feature")) {
            resolution.mainRepoPath = QStringLiteral("/repos/app");
            resolution.isWorktree = true;
        }
        return resolution;
    }

    mutable int statusCalls = 0;
};

const QByteArray ParentLog = QByteArrayLiteral(
    R"({"type":"user","timestamp":"2025-06-01T10:00:00.000Z","message":{"role":"user","content":"Investigate the flaky test"}})"
    "\n"
    R"({"type":"assistant","timestamp":"2025-06-01T10:00:01.000Z","message":{"content":[{"type":"tool_use","id":"t1","name":"Task","input":{"description":"Dig into logs"}}]}})"
    "\n"
    R"({"type":"user","timestamp":"2025-06-01T10:00:05.000Z","toolUseResult":{"agentId":"abc"},"message":{"content":[{"type":"tool_result","tool_use_id":"t1","content":"found it"}]}})"
    "\n"
    R"({"type":"assistant","timestamp":"2025-06-01T10:00:06.000Z","message":{"content":[{"type":"text","text":"Fixed"}]}})"
    "\n");

const QByteArray SubagentLog = QByteArrayLiteral(
    R"({"type":"user","timestamp":"2025-06-01T10:00:02.000Z","isSidechain":true,"message":{"content":"Dig into logs"}})"
    "\n"
    R"({"type":"assistant","timestamp":"2025-06-01T10:00:03.000Z","isSidechain":true,"message":{"content":[{"type":"text","text":"Reading"}]}})"
    "\n");
}

void SessionLogStoreTest::init()
{
    WorktreeResolver::clearCache();
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());
}

void SessionLogStoreTest::cleanup()
{
    delete m_tempDir;
    m_tempDir = nullptr;
}

QString SessionLogStoreTest::root() const
{
    return m_tempDir->filePath(QStringLiteral("projects"));
}

QString SessionLogStoreTest::writeFile(const QString &relativePath, const QByteArray &content)
{
    const QString path = QDir(root()).filePath(relativePath);
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    if (file.open(QIODevice::WriteOnly)) {
        file.write(content);
        file.close();
    }
    return path;
}

void SessionLogStoreTest::testFindLogFileForSession()
{
    const QString path = writeFile(QStringLiteral("-repos-app/s1.jsonl"), ParentLog);
    writeFile(QStringLiteral("-repos-other/s2.jsonl"), ParentLog);

    StubInspector inspector;
    SessionLogStore store(root(), &inspector);

    QCOMPARE(store.findLogFileForSession(QStringLiteral("s1")), path);
    QVERIFY(store.findLogFileForSession(QStringLiteral("nope")).isNull());
    QVERIFY(store.findLogFileForSession(QString()).isNull());
    QVERIFY(store.findLogFileForSession(QStringLiteral("../-repos-app/s1")).isNull());

    SessionLogStore missing(m_tempDir->filePath(QStringLiteral("absent")), &inspector);
    QVERIFY(missing.findLogFileForSession(QStringLiteral("s1")).isNull());
}

void SessionLogStoreTest::testFindSubagentLogFiles()
{
    writeFile(QStringLiteral("-repos-app/s1.jsonl"), ParentLog);
    const QString second = writeFile(QStringLiteral("-repos-app/s1/subagents/agent-zz9.jsonl"), SubagentLog);
    const QString first = writeFile(QStringLiteral("-repos-app/s1/subagents/agent-abc.jsonl"), SubagentLog);
    writeFile(QStringLiteral("-repos-app/s1/subagents/notes.jsonl"), SubagentLog);
    writeFile(QStringLiteral("-repos-app/s1/subagents/agent-.jsonl"), SubagentLog);

    StubInspector inspector;
    SessionLogStore store(root(), &inspector);

    const QList<SubagentLogFile> files = store.findSubagentLogFiles(QStringLiteral("s1"));
    QCOMPARE(files.size(), 2);
    QCOMPARE(files.at(0).agentId, QStringLiteral("abc"));
    QCOMPARE(files.at(0).path, first);
    QCOMPARE(files.at(1).agentId, QStringLiteral("zz9"));
    QCOMPARE(files.at(1).path, second);

    writeFile(QStringLiteral("-repos-app/lonely.jsonl"), ParentLog);
    QVERIFY(store.findSubagentLogFiles(QStringLiteral("lonely")).isEmpty());
    QVERIFY(store.findSubagentLogFiles(QStringLiteral("missing")).isEmpty());
}

void SessionLogStoreTest::testConversationTimeline()
{
    writeFile(QStringLiteral("-repos-app/s1.jsonl"), ParentLog);
    writeFile(QStringLiteral("-repos-app/s1/subagents/agent-abc.jsonl"), SubagentLog);

    StubInspector inspector;
    SessionLogStore store(root(), &inspector);

    const QList<ConversationMessage> timeline = store.conversationTimeline({QStringLiteral("s1")});
    QStringList contents;
    QStringList teams;
    for (const ConversationMessage &message : timeline) {
        contents.append(message.content);
        teams.append(message.teamName);
    }

    QCOMPARE(contents,
             (QStringList{QStringLiteral("Investigate the flaky test"),
                          QStringLiteral(R"({"description":"Dig into logs"})"),
                          QStringLiteral("Dig into logs"),
                          QStringLiteral("Reading"),
                          QStringLiteral("found it"),
                          QStringLiteral("Fixed")}));
    QCOMPARE(teams,
             (QStringList{QString(), QString(), QStringLiteral("Dig into logs"), QStringLiteral("Dig into logs"), QString(), QString()}));

    QVERIFY(store.conversationTimeline({QStringLiteral("unknown")}).isEmpty());
}

void SessionLogStoreTest::testListSessions()
{
    const QString older = writeFile(QStringLiteral("-repos-app/old.jsonl"), ParentLog);
    const QString newer = writeFile(QStringLiteral("-repos-app/new.jsonl"), ParentLog);
    writeFile(QStringLiteral("-repos-app/new/subagents/agent-abc.jsonl"), SubagentLog);

    const QDateTime base = QDateTime::currentDateTimeUtc().addSecs(-600);
    {
        QFile file(older);
        QVERIFY(file.open(QIODevice::ReadWrite));
        QVERIFY(file.setFileTime(base, QFileDevice::FileModificationTime));
    }
    {
        QFile file(newer);
        QVERIFY(file.open(QIODevice::ReadWrite));
        QVERIFY(file.setFileTime(base.addSecs(60), QFileDevice::FileModificationTime));
    }

    StubInspector inspector;
    SessionLogStore store(root(), &inspector, SessionLocator::StrategyMode::Scan);

    const SessionPage page = store.listSessions(1, 0);
    QCOMPARE(page.total, 2);
    QVERIFY(page.hasMore);
    QCOMPARE(page.sessions.size(), 1);
    QCOMPARE(page.sessions.at(0).sessionId, QStringLiteral("new"));
    QCOMPARE(page.sessions.at(0).projectDirName, QStringLiteral("-repos-app"));
    QCOMPARE(page.sessions.at(0).logPath, newer);

    const SessionPage rest = store.listSessions(5, 1);
    QCOMPARE(rest.sessions.size(), 1);
    QCOMPARE(rest.sessions.at(0).sessionId, QStringLiteral("old"));
    QVERIFY(!rest.hasMore);
}

void SessionLogStoreTest::testPreview()
{
    const QString path = writeFile(
        QStringLiteral("-repos-app/p.jsonl"),
        QByteArrayLiteral(R"({"type":"summary","summary":"Earlier work"})"
                          "\n"
                          R"({"type":"user","isMeta":true,"message":{"content":"<command-name>/clear</command-name>"}})"
                          "\n"
                          R"({"type":"user","message":{"content":[{"type":"tool_result","tool_use_id":"t","content":"output"}]}})"
                          "\n"
                          "this line is not json\n"
                          R"({"type":"assistant","message":{"content":[{"type":"text","text":"Hello"}]}})"
                          "\n"
                          R"({"type":"user","message":{"content":[{"type":"text","text":"  Please refactor the session list so it pages  "}]}})"
                          "\n"
                          R"({"type":"user","message":{"content":"second prompt"}})"
                          "\n"));

    StubInspector inspector;
    SessionLogStore store(root(), &inspector);

    QCOMPARE(store.preview(path, 200), QStringLiteral("Please refactor the session list so it pages"));
    QCOMPARE(store.preview(path, 10), QStringLiteral("Please ..."));
    QCOMPARE(store.preview(path, 10).size(), 10);
    QCOMPARE(store.preview(path, 0), QStringLiteral("Please refactor the session list so it pages"));
}

void SessionLogStoreTest::testPreviewMissingOrEmpty()
{
    StubInspector inspector;
    SessionLogStore store(root(), &inspector);

    QVERIFY(store.preview(m_tempDir->filePath(QStringLiteral("missing.jsonl")), 50).isNull());

    const QString assistantOnly =
        writeFile(QStringLiteral("-repos-app/quiet.jsonl"), QByteArrayLiteral(R"({"type":"assistant","message":{"content":"only me"}})"
                                                                             "\n"));
    QVERIFY(store.preview(assistantOnly, 50).isNull());

    const QString empty = writeFile(QStringLiteral("-repos-app/empty.jsonl"), QByteArray());
    QVERIFY(store.preview(empty, 50).isNull());
}

void SessionLogStoreTest::testTruncatePreview()
{
    QCOMPARE(SessionLogStore::truncatePreview(QStringLiteral("short"), 10), QStringLiteral("short"));
    QCOMPARE(SessionLogStore::truncatePreview(QStringLiteral("exactly10!"), 10), QStringLiteral("exactly10!"));
    QCOMPARE(SessionLogStore::truncatePreview(QStringLiteral("abcdefghijk"), 10), QStringLiteral("abcdefg..."));
    QCOMPARE(SessionLogStore::truncatePreview(QStringLiteral("abcdef"), 2), QStringLiteral("..."));
    QCOMPARE(SessionLogStore::truncatePreview(QStringLiteral("abcdef"), -1), QStringLiteral("abcdef"));

    // U+1F600 is a surrogate pair straddling the cut; it goes whole
    const QString emoji = QStringLiteral("abcdef") + QString::fromUcs4(U"\U0001F600") + QStringLiteral("xyz");
    QCOMPARE(emoji.size(), 11);
    const QString cut = SessionLogStore::truncatePreview(emoji, 10);
    QCOMPARE(cut, QStringLiteral("abcdef..."));
    for (const QChar c : cut) {
        QVERIFY(!c.isSurrogate());
    }

    // A pair well inside the cut stays intact
    QCOMPARE(SessionLogStore::truncatePreview(emoji, 11), emoji);
    const QString early = QStringLiteral("ab") + QString::fromUcs4(U"\U0001F600") + QStringLiteral("cdefghij");
    QCOMPARE(SessionLogStore::truncatePreview(early, 10), QStringLiteral("ab") + QString::fromUcs4(U"\U0001F600") + QStringLiteral("cde..."));
}

void SessionLogStoreTest::testDirectoryStatusCached()
{
    StubInspector inspector;
    SessionLogStore store(root(), &inspector);

    const RepositoryStatus status = store.directoryStatus(QStringLiteral("/repos/app"));
    QVERIFY(status.isRepo);
    QCOMPARE(status.branch, QStringLiteral("app"));

    store.directoryStatus(QStringLiteral("/repos/app"));
    QCOMPARE(inspector.statusCalls, 1);

    QVERIFY(!store.directoryStatus(QStringLiteral("/tmp/scratch")).isRepo);
    QCOMPARE(inspector.statusCalls, 2);
}

void SessionLogStoreTest::testFindChatFromChatStore()
{
    const QString logPath = writeFile(QStringLiteral("-repos-app-feature/sess-b.jsonl"), ParentLog);

    ChatFileStore chats(m_tempDir->filePath(QStringLiteral("data")));
    chats.upsertChat(QStringLiteral("chat-1"), QStringLiteral("/repos/app-feature"), QStringLiteral("sess-b"), QStringLiteral(R"({"session_ids":["sess-a","sess-b"]})"));

    StubInspector inspector;
    SessionLogStore store(root(), &inspector);
    store.setChatStore(&chats);

    const ChatLookup lookup = store.findChat(QStringLiteral("chat-1"));
    QVERIFY(lookup.isValid());
    QVERIFY(!lookup.fromFilesystem);
    QCOMPARE(lookup.sessionId, QStringLiteral("sess-b"));
    QCOMPARE(lookup.sessionIds, (QStringList{QStringLiteral("sess-a"), QStringLiteral("sess-b")}));
    QCOMPARE(lookup.logPath, logPath);
    QCOMPARE(lookup.originalFolder, QStringLiteral("/repos/app-feature"));
    QCOMPARE(lookup.folder, QStringLiteral("/repos/app"));

    // Status comes from the worktree itself, not its main checkout
    QVERIFY(lookup.hasStatus);
    QCOMPARE(lookup.status.branch, QStringLiteral("app-feature"));

    const QJsonObject json = lookup.toJson();
    QCOMPARE(json.value(QStringLiteral("git_branch")).toString(), QStringLiteral("app-feature"));
    QVERIFY(json.value(QStringLiteral("is_git_repo")).toBool());
    QVERIFY(!json.contains(QStringLiteral("from_filesystem")));

    // The session id reaches the same chat
    QCOMPARE(store.findChat(QStringLiteral("sess-b"), false).id, QStringLiteral("chat-1"));
    QVERIFY(!store.findChat(QStringLiteral("sess-b"), false).hasStatus);
}

void SessionLogStoreTest::testFindChatFromFilesystem()
{
    const QString logPath = writeFile(QStringLiteral("-repos-app/orphan.jsonl"), ParentLog);

    ChatFileStore chats(m_tempDir->filePath(QStringLiteral("data")));
    StubInspector inspector;
    SessionLogStore store(root(), &inspector);
    store.setChatStore(&chats);

    const ChatLookup lookup = store.findChat(QStringLiteral("orphan"), false);
    QVERIFY(lookup.isValid());
    QVERIFY(lookup.fromFilesystem);
    QCOMPARE(lookup.id, QStringLiteral("orphan"));
    QCOMPARE(lookup.sessionIds, QStringList{QStringLiteral("orphan")});
    QCOMPARE(lookup.logPath, logPath);
    QCOMPARE(lookup.originalFolder, ProjectPathCodec::decodeProjectDirectory(QStringLiteral("-repos-app")));
    QCOMPARE(lookup.metadata, QStringLiteral(R"({"session_ids":["orphan"]})"));
    QVERIFY(!lookup.updatedAt.isEmpty());

    const QJsonObject json = lookup.toJson();
    QVERIFY(json.value(QStringLiteral("from_filesystem")).toBool());
    QVERIFY(!json.contains(QStringLiteral("is_git_repo")));
}

void SessionLogStoreTest::testFindChatUnknown()
{
    StubInspector inspector;
    SessionLogStore store(root(), &inspector);

    QVERIFY(!store.findChat(QStringLiteral("ghost")).isValid());
    QVERIFY(!store.findChat(QString()).isValid());
    QCOMPARE(inspector.statusCalls, 0);
}

QTEST_GUILESS_MAIN(SessionLogStoreTest)

#include "moc_SessionLogStoreTest.cpp"
