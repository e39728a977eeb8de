/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef DIRECTORYSTATUSCACHE_H
#define DIRECTORYSTATUSCACHE_H

#include "callboard_export.h"

#include "RepositoryInspector.h"

#include <QHash>
#include <QReadWriteLock>
#include <QString>

#include <functional>

namespace Callboard
{

/**
 * DirectoryStatusCache keeps repository status per directory for a short TTL.
 *
 * Entries are recomputed lazily on the first access at or after their TTL;
 * nothing is evicted in the background. An inspector failure is stored as
 * {isRepo: false} like any other result.
 */
class CALLBOARD_EXPORT DirectoryStatusCache
{
public:
    using Clock = std::function<qint64()>; // milliseconds

    static constexpr qint64 DefaultTtlMs = 5 * 60 * 1000;

    explicit DirectoryStatusCache(const RepositoryInspector *inspector, qint64 ttlMs = DefaultTtlMs, Clock clock = Clock());

    RepositoryStatus status(const QString &directory);

    qint64 ttlMs() const { return m_ttlMs; }

    void clear();
    int size() const;

private:
    struct Entry {
        RepositoryStatus status;
        qint64 insertedAt = 0;
    };

    RepositoryStatus lookup(const QString &directory) const;

    const RepositoryInspector *m_inspector = nullptr;
    qint64 m_ttlMs = DefaultTtlMs;
    Clock m_clock;

    mutable QReadWriteLock m_lock;
    QHash<QString, Entry> m_entries;
};

} // namespace Callboard

#endif // DIRECTORYSTATUSCACHE_H
