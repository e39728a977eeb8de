/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONLOCATOR_H
#define SESSIONLOCATOR_H

#include "callboard_export.h"

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

#include <memory>

namespace Callboard
{

class WorktreeResolver;

/**
 * Lightweight description of one session log, built for a listing page
 */
struct CALLBOARD_EXPORT SessionDescriptor {
    QString sessionId;
    QString projectDirName; // encoded folder name under the store root
    QString folder; // decoded working directory, possibly a worktree
    QString displayFolder; // main checkout of folder
    QString logPath;
    QDateTime created;
    QDateTime modified;

    QJsonObject toJson() const;
};

/**
 * One page of a session listing
 */
struct CALLBOARD_EXPORT SessionPage {
    QList<SessionDescriptor> sessions;
    int total = 0;
    bool hasMore = false;
};

/**
 * A way of enumerating every session log under a store root,
 * newest modification first, ties by ascending path.
 *
 * Only "<root>/<project>/<session>.jsonl" counts; logs nested deeper
 * (subagents) are never returned.
 */
class CALLBOARD_EXPORT SessionListingStrategy
{
public:
    virtual ~SessionListingStrategy() = default;

    virtual QString name() const = 0;

    /**
     * Whether the strategy can run on this system at all
     */
    virtual bool isAvailable() const = 0;

    /**
     * @p ok is false when enumeration itself failed, as opposed to an empty store
     */
    virtual QStringList orderedLogPaths(const QString &root, bool *ok = nullptr) const = 0;
};

/**
 * Enumerates with a single find(1) traversal that prints each file's
 * mtime, so unselected files are never stat'ed individually.
 */
class CALLBOARD_EXPORT FindTraversalStrategy : public SessionListingStrategy
{
public:
    QString name() const override;
    bool isAvailable() const override;
    QStringList orderedLogPaths(const QString &root, bool *ok = nullptr) const override;

    /**
     * Parse "<seconds>.<fraction>\t<path>" lines into ordered paths.
     * Lines that do not match are ignored.
     */
    static QStringList parseFindOutput(const QByteArray &output);

    /**
     * "1712345678.1234567890" -> 1712345678123. Sets @p ok to false on malformed input.
     */
    static qint64 parseFindTimestamp(const QByteArray &value, bool *ok = nullptr);

    static constexpr int TraversalTimeoutMs = 10000;
};

/**
 * Portable enumeration through QDir that stats every log file.
 * Symbolic links below the root are skipped, as the find traversal does.
 */
class CALLBOARD_EXPORT ExhaustiveScanStrategy : public SessionListingStrategy
{
public:
    QString name() const override;
    bool isAvailable() const override;
    QStringList orderedLogPaths(const QString &root, bool *ok = nullptr) const override;
};

/**
 * SessionLocator pages through the session logs of a store root.
 *
 * The primary strategy runs first; if it is missing, fails or finds nothing
 * the fallback scan runs instead. Only the sessions on the requested page
 * are stat'ed and have their folder decoded.
 */
class CALLBOARD_EXPORT SessionLocator
{
public:
    enum class StrategyMode {
        Auto,
        Find,
        Scan,
    };

    SessionLocator(const QString &root, const WorktreeResolver *resolver = nullptr, StrategyMode mode = StrategyMode::Auto);

    /**
     * Use explicit strategies. @p primary may be null to always scan with @p fallback.
     */
    SessionLocator(const QString &root,
                   const WorktreeResolver *resolver,
                   std::unique_ptr<SessionListingStrategy> primary,
                   std::unique_ptr<SessionListingStrategy> fallback);

    ~SessionLocator();

    QString root() const { return m_root; }

    /**
     * Page [offset, offset + limit) of sessions, newest first.
     * A non-positive limit yields an empty page that still reports the total.
     */
    SessionPage listSessions(int limit, int offset) const;

    /**
     * Every session log path in listing order
     */
    QStringList orderedLogPaths() const;

    /**
     * Build the descriptor for one log file
     */
    SessionDescriptor describe(const QString &logPath) const;

    static StrategyMode modeFromString(const QString &mode);
    static QString modeToString(StrategyMode mode);

private:
    QString m_root;
    const WorktreeResolver *m_resolver = nullptr;
    std::unique_ptr<SessionListingStrategy> m_primary;
    std::unique_ptr<SessionListingStrategy> m_fallback;
};

} // namespace Callboard

#endif // SESSIONLOCATOR_H
