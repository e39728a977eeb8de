/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WorktreeResolver.h"

#include <QDebug>
#include <QHash>
#include <QReadWriteLock>

#include <exception>

namespace Callboard
{

namespace
{
struct ResolutionCache {
    QReadWriteLock lock;
    QHash<QString, WorktreeResolution> entries;
};

ResolutionCache &resolutionCache()
{
    static ResolutionCache cache;
    return cache;
}
}

WorktreeResolver::WorktreeResolver(const RepositoryInspector *inspector)
    : m_inspector(inspector)
{
}

WorktreeResolution WorktreeResolver::resolve(const QString &path) const
{
    WorktreeResolution identity;
    identity.mainRepoPath = path;

    if (path.isEmpty() || !m_inspector) {
        return identity;
    }

    ResolutionCache &cache = resolutionCache();
    {
        QReadLocker locker(&cache.lock);
        const auto it = cache.entries.constFind(path);
        if (it != cache.entries.constEnd()) {
            return it.value();
        }
    }

    WorktreeResolution resolution = identity;
    try {
        resolution = m_inspector->resolveWorktree(path);
        if (resolution.mainRepoPath.isEmpty()) {
            resolution = identity;
        }
    } catch (const std::exception &e) {
        qWarning() << "WorktreeResolver: Failed to resolve" << path << "-" << e.what();
        resolution = identity;
    }

    QWriteLocker locker(&cache.lock);
    cache.entries.insert(path, resolution);
    return resolution;
}

QString WorktreeResolver::mainRepoPath(const QString &path) const
{
    return resolve(path).mainRepoPath;
}

void WorktreeResolver::clearCache()
{
    ResolutionCache &cache = resolutionCache();
    QWriteLocker locker(&cache.lock);
    cache.entries.clear();
}

int WorktreeResolver::cacheSize()
{
    ResolutionCache &cache = resolutionCache();
    QReadLocker locker(&cache.lock);
    return static_cast<int>(cache.entries.size());
}

} // namespace Callboard
