/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef DIRECTORYSTATUSCACHETEST_H
#define DIRECTORYSTATUSCACHETEST_H

#include <QObject>

namespace Callboard
{

class DirectoryStatusCacheTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testHitWithinTtl();
    void testRecomputeAfterTtl();
    void testKeyedByDirectory();
    void testInspectorFailureDegrades();
    void testNullInspector();
    void testClear();
    void testGitInspectorOnPlainDirectory();
};

}

#endif // DIRECTORYSTATUSCACHETEST_H
