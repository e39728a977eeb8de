/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKTREERESOLVER_H
#define WORKTREERESOLVER_H

#include "callboard_export.h"

#include "RepositoryInspector.h"

#include <QString>

namespace Callboard
{

/**
 * WorktreeResolver maps a working directory to the main checkout it
 * belongs to, for grouping and display.
 *
 * Results live in a process-wide cache keyed by the original path and are
 * never invalidated: the mapping is assumed stable for the lifetime of the
 * process. clearCache() exists for tests. Lookups are safe from any thread.
 *
 * Inspector failures resolve to the identity mapping and are cached too.
 */
class CALLBOARD_EXPORT WorktreeResolver
{
public:
    explicit WorktreeResolver(const RepositoryInspector *inspector);

    WorktreeResolution resolve(const QString &path) const;

    /**
     * Convenience: main checkout path for @p path
     */
    QString mainRepoPath(const QString &path) const;

    static void clearCache();
    static int cacheSize();

private:
    const RepositoryInspector *m_inspector = nullptr;
};

} // namespace Callboard

#endif // WORKTREERESOLVER_H
