/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PROJECTPATHCODECTEST_H
#define PROJECTPATHCODECTEST_H

#include <QObject>
#include <QTemporaryDir>

namespace Callboard
{

class ProjectPathCodecTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();
    void cleanup();

    void testEncode();
    void testDecodeRoot();
    void testDecodePlainPath();
    void testDecodeDashedDirectory();
    void testDecodeDottedSegment();
    void testDecodeMergedSegments();
    void testDecodeMissingPathBestEffort();
    void testDotVariants();

private:
    QString makeDir(const QString &relativePath);

    QTemporaryDir *m_tempDir = nullptr;
    QString m_base;
};

}

#endif // PROJECTPATHCODECTEST_H
