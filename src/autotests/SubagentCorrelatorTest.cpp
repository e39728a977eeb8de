/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "SubagentCorrelatorTest.h"

// Qt
#include <QTest>

// Callboard
#include "../sessionlog/SessionLogRecord.h"
#include "../sessionlog/SubagentCorrelator.h"

using namespace Callboard;

static QByteArray taskInvocation(const QByteArray &toolUseId, const QByteArray &description)
{
    return QByteArrayLiteral(R"({"type":"assistant","message":{"role":"assistant","content":[{"type":"tool_use","id":")") + toolUseId
        + QByteArrayLiteral(R"(","name":"Task","input":{"description":")") + description + QByteArrayLiteral(R"(","prompt":"Go"}}]}})") + '\n';
}

static QByteArray taskResult(const QByteArray &toolUseId, const QByteArray &agentId)
{
    return QByteArrayLiteral(R"({"type":"user","toolUseResult":{"agentId":")") + agentId
        + QByteArrayLiteral(R"("},"message":{"role":"user","content":[{"type":"tool_result","tool_use_id":")") + toolUseId
        + QByteArrayLiteral(R"(","content":[{"type":"text","text":"Finished"}]}]}})") + '\n';
}

void SubagentCorrelatorTest::testTaskDescriptionCorrelation()
{
    const QList<SessionLogRecord> records = SessionLogDecoder::decodeLines(taskInvocation("abc", "Research") + taskResult("abc", "agent-1"));

    const QHash<QString, QString> labels = SubagentCorrelator::correlate(records);
    QCOMPARE(labels.size(), 1);
    QCOMPARE(labels.value(QStringLiteral("agent-1")), QStringLiteral("Research"));
}

void SubagentCorrelatorTest::testMissingDescriptionFallsBack()
{
    // Result answers an invocation that never appeared
    const QList<SessionLogRecord> records = SessionLogDecoder::decodeLines(taskResult("zzz", "a7"));

    const QHash<QString, QString> labels = SubagentCorrelator::correlate(records);
    QCOMPARE(labels.value(QStringLiteral("a7")), QStringLiteral("Agent a7"));
    QCOMPARE(SubagentCorrelator::fallbackLabel(QStringLiteral("a7")), QStringLiteral("Agent a7"));
}

void SubagentCorrelatorTest::testResultBeforeInvocation()
{
    const QList<SessionLogRecord> records = SessionLogDecoder::decodeLines(taskResult("abc", "agent-1") + taskInvocation("abc", "Late description"));

    const QHash<QString, QString> labels = SubagentCorrelator::correlate(records);
    QCOMPARE(labels.value(QStringLiteral("agent-1")), QStringLiteral("Late description"));
}

void SubagentCorrelatorTest::testNonTaskToolsIgnored()
{
    const QByteArray bash = QByteArrayLiteral(
        R"({"type":"assistant","message":{"content":[{"type":"tool_use","id":"abc","name":"Bash","input":{"description":"List files","command":"ls"}}]}})"
        "\n");

    const QList<SessionLogRecord> records = SessionLogDecoder::decodeLines(bash + taskResult("abc", "agent-1"));

    const QHash<QString, QString> labels = SubagentCorrelator::correlate(records);
    QCOMPARE(labels.value(QStringLiteral("agent-1")), QStringLiteral("Agent agent-1"));

    // No agentId anywhere: nothing to correlate
    QVERIFY(SubagentCorrelator::correlate(SessionLogDecoder::decodeLines(bash)).isEmpty());
}

void SubagentCorrelatorTest::testMultipleAgents()
{
    const QList<SessionLogRecord> records = SessionLogDecoder::decodeLines(taskInvocation("t1", "Explore codebase") + taskInvocation("t2", "Write tests")
                                                                           + taskResult("t2", "b") + taskResult("t1", "a"));

    const QHash<QString, QString> labels = SubagentCorrelator::correlate(records);
    QCOMPARE(labels.size(), 2);
    QCOMPARE(labels.value(QStringLiteral("a")), QStringLiteral("Explore codebase"));
    QCOMPARE(labels.value(QStringLiteral("b")), QStringLiteral("Write tests"));
}

QTEST_GUILESS_MAIN(SubagentCorrelatorTest)

#include "moc_SubagentCorrelatorTest.cpp"
