/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "DirectoryStatusCache.h"

#include <QDateTime>
#include <QDebug>

#include <exception>

namespace Callboard
{

DirectoryStatusCache::DirectoryStatusCache(const RepositoryInspector *inspector, qint64 ttlMs, Clock clock)
    : m_inspector(inspector)
    , m_ttlMs(ttlMs)
    , m_clock(std::move(clock))
{
    if (!m_clock) {
        m_clock = []() {
            return QDateTime::currentMSecsSinceEpoch();
        };
    }
}

RepositoryStatus DirectoryStatusCache::lookup(const QString &directory) const
{
    if (!m_inspector) {
        return RepositoryStatus();
    }

    try {
        return m_inspector->repositoryStatus(directory);
    } catch (const std::exception &e) {
        qWarning() << "DirectoryStatusCache: Status lookup failed for" << directory << "-" << e.what();
    }
    return RepositoryStatus();
}

RepositoryStatus DirectoryStatusCache::status(const QString &directory)
{
    const qint64 now = m_clock();

    {
        QReadLocker locker(&m_lock);
        const auto it = m_entries.constFind(directory);
        if (it != m_entries.constEnd() && now - it->insertedAt < m_ttlMs) {
            return it->status;
        }
    }

    Entry entry;
    entry.status = lookup(directory);
    entry.insertedAt = now;

    QWriteLocker locker(&m_lock);
    m_entries.insert(directory, entry);
    return entry.status;
}

void DirectoryStatusCache::clear()
{
    QWriteLocker locker(&m_lock);
    m_entries.clear();
}

int DirectoryStatusCache::size() const
{
    QReadLocker locker(&m_lock);
    return static_cast<int>(m_entries.size());
}

} // namespace Callboard
