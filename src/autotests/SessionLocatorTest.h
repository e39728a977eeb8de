/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONLOCATORTEST_H
#define SESSIONLOCATORTEST_H

#include <QDateTime>
#include <QObject>
#include <QTemporaryDir>

namespace Callboard
{

class SessionLocatorTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void init();
    void cleanup();

    void testNewestFirst();
    void testPagesCoverListing();
    void testTotalInvariantAcrossPages();
    void testPageBounds();
    void testSubagentLogsExcluded();
    void testFindAndScanAgree();
    void testSymlinksSkippedByBoth();
    void testTieBrokenByPath();
    void testFallbackWhenPrimaryFails();
    void testFallbackWhenPrimaryEmpty();
    void testScanOnlyMode();
    void testMissingRoot();
    void testDescriptor();
    void testParseFindOutput();
    void testModeStrings();

private:
    QString writeLog(const QString &relativePath, qint64 modifiedOffsetSecs);

    QTemporaryDir *m_tempDir = nullptr;
    QString m_root;
    QDateTime m_baseTime;
};

}

#endif // SESSIONLOCATORTEST_H
