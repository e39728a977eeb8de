/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionLocator.h"

#include "ProjectPathCodec.h"
#include "WorktreeResolver.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

#include <algorithm>

namespace Callboard
{

namespace
{
const QString LogSuffix = QStringLiteral(".jsonl");

struct LogFileEntry {
    qint64 modifiedMs = 0;
    QString path;
};

QStringList sortedPaths(QList<LogFileEntry> &entries)
{
    std::sort(entries.begin(), entries.end(), [](const LogFileEntry &a, const LogFileEntry &b) {
        if (a.modifiedMs != b.modifiedMs) {
            return a.modifiedMs > b.modifiedMs;
        }
        return a.path < b.path;
    });

    QStringList paths;
    paths.reserve(entries.size());
    for (const LogFileEntry &entry : entries) {
        paths.append(entry.path);
    }
    return paths;
}
}

QJsonObject SessionDescriptor::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("session_id")] = sessionId;
    obj[QStringLiteral("project_dir")] = projectDirName;
    obj[QStringLiteral("folder")] = displayFolder;
    obj[QStringLiteral("original_folder")] = folder;
    obj[QStringLiteral("session_log_path")] = logPath;
    obj[QStringLiteral("created_at")] = created.toUTC().toString(Qt::ISODateWithMs);
    obj[QStringLiteral("updated_at")] = modified.toUTC().toString(Qt::ISODateWithMs);
    return obj;
}

// ---------------------------------------------------------------------------
// FindTraversalStrategy

QString FindTraversalStrategy::name() const
{
    return QStringLiteral("find");
}

bool FindTraversalStrategy::isAvailable() const
{
#ifdef Q_OS_LINUX
    // -printf is a GNU extension
    return !QStandardPaths::findExecutable(QStringLiteral("find")).isEmpty();
#else
    return false;
#endif
}

qint64 FindTraversalStrategy::parseFindTimestamp(const QByteArray &value, bool *ok)
{
    if (ok) *ok = false;

    // Files dated before the epoch print as "-5.5000000000"
    const bool negative = value.startsWith('-');
    const QByteArray magnitude = negative ? value.mid(1) : value;

    const int dot = magnitude.indexOf('.');
    const QByteArray secondsPart = dot >= 0 ? magnitude.left(dot) : magnitude;

    bool parsed = false;
    const qint64 seconds = secondsPart.toLongLong(&parsed);
    if (!parsed || seconds < 0) {
        return 0;
    }

    qint64 millis = 0;
    if (dot >= 0) {
        QByteArray fraction = magnitude.mid(dot + 1, 3);
        while (fraction.size() < 3) {
            fraction.append('0');
        }
        millis = fraction.toLongLong(&parsed);
        if (!parsed || millis < 0) {
            return 0;
        }
    }

    if (ok) *ok = true;
    const qint64 total = seconds * 1000 + millis;
    return negative ? -total : total;
}

QStringList FindTraversalStrategy::parseFindOutput(const QByteArray &output)
{
    QList<LogFileEntry> entries;

    const QList<QByteArray> lines = output.split('\n');
    for (const QByteArray &line : lines) {
        const int tab = line.indexOf('\t');
        if (tab <= 0) {
            continue;
        }

        bool ok = false;
        const qint64 modifiedMs = parseFindTimestamp(line.left(tab), &ok);
        const QString path = QString::fromUtf8(line.mid(tab + 1));
        if (!ok || path.isEmpty()) {
            continue;
        }

        entries.append({modifiedMs, path});
    }

    return sortedPaths(entries);
}

QStringList FindTraversalStrategy::orderedLogPaths(const QString &root, bool *ok) const
{
    if (ok) *ok = false;

    if (!QFileInfo(root).isDir()) {
        return {};
    }

    // depth 2 is <root>/<project>/<session>.jsonl; subagent logs sit deeper.
    // -H follows a symlinked root only, like QDir does.
    const QStringList args = {QStringLiteral("-H"),
                              root,
                              QStringLiteral("-mindepth"),
                              QStringLiteral("2"),
                              QStringLiteral("-maxdepth"),
                              QStringLiteral("2"),
                              QStringLiteral("-type"),
                              QStringLiteral("f"),
                              QStringLiteral("-name"),
                              QStringLiteral("*.jsonl"),
                              QStringLiteral("-printf"),
                              QStringLiteral("%T@\\t%p\\n")};

    QProcess process;
    process.start(QStringLiteral("find"), args);

    if (!process.waitForFinished(TraversalTimeoutMs)) {
        qWarning() << "FindTraversalStrategy: find timed out or failed to start for" << root;
        process.kill();
        process.waitForFinished(1000);
        return {};
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        qWarning() << "FindTraversalStrategy: find exited with" << process.exitCode() << process.readAllStandardError().trimmed();
        return {};
    }

    if (ok) *ok = true;
    return parseFindOutput(process.readAllStandardOutput());
}

// ---------------------------------------------------------------------------
// ExhaustiveScanStrategy

QString ExhaustiveScanStrategy::name() const
{
    return QStringLiteral("scan");
}

bool ExhaustiveScanStrategy::isAvailable() const
{
    return true;
}

QStringList ExhaustiveScanStrategy::orderedLogPaths(const QString &root, bool *ok) const
{
    if (ok) *ok = false;

    QDir rootDir(root);
    if (root.isEmpty() || !rootDir.exists()) {
        return {};
    }

    QList<LogFileEntry> entries;

    const QFileInfoList projectDirs = rootDir.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden | QDir::NoSymLinks);
    for (const QFileInfo &projectDir : projectDirs) {
        QDir dir(projectDir.absoluteFilePath());
        const QFileInfoList logs = dir.entryInfoList({QStringLiteral("*") + LogSuffix}, QDir::Files | QDir::Hidden | QDir::NoSymLinks);
        for (const QFileInfo &log : logs) {
            entries.append({log.lastModified().toMSecsSinceEpoch(), rootDir.filePath(projectDir.fileName() + QLatin1Char('/') + log.fileName())});
        }
    }

    if (ok) *ok = true;
    return sortedPaths(entries);
}

// ---------------------------------------------------------------------------
// SessionLocator

SessionLocator::SessionLocator(const QString &root, const WorktreeResolver *resolver, StrategyMode mode)
    : m_root(QDir::cleanPath(root))
    , m_resolver(resolver)
    , m_fallback(std::make_unique<ExhaustiveScanStrategy>())
{
    if (mode != StrategyMode::Scan) {
        m_primary = std::make_unique<FindTraversalStrategy>();
    }
}

SessionLocator::SessionLocator(const QString &root,
                               const WorktreeResolver *resolver,
                               std::unique_ptr<SessionListingStrategy> primary,
                               std::unique_ptr<SessionListingStrategy> fallback)
    : m_root(QDir::cleanPath(root))
    , m_resolver(resolver)
    , m_primary(std::move(primary))
    , m_fallback(std::move(fallback))
{
    if (!m_fallback) {
        m_fallback = std::make_unique<ExhaustiveScanStrategy>();
    }
}

SessionLocator::~SessionLocator() = default;

SessionLocator::StrategyMode SessionLocator::modeFromString(const QString &mode)
{
    const QString normalized = mode.trimmed().toLower();
    if (normalized == QLatin1String("find")) {
        return StrategyMode::Find;
    }
    if (normalized == QLatin1String("scan")) {
        return StrategyMode::Scan;
    }
    return StrategyMode::Auto;
}

QString SessionLocator::modeToString(StrategyMode mode)
{
    switch (mode) {
    case StrategyMode::Find:
        return QStringLiteral("find");
    case StrategyMode::Scan:
        return QStringLiteral("scan");
    case StrategyMode::Auto:
        break;
    }
    return QStringLiteral("auto");
}

QStringList SessionLocator::orderedLogPaths() const
{
    if (m_primary && m_primary->isAvailable()) {
        bool ok = false;
        const QStringList paths = m_primary->orderedLogPaths(m_root, &ok);
        if (ok && !paths.isEmpty()) {
            return paths;
        }
        if (!ok) {
            qWarning() << "SessionLocator:" << m_primary->name() << "listing failed, falling back to" << m_fallback->name();
        }
    } else if (m_primary) {
        qDebug() << "SessionLocator:" << m_primary->name() << "unavailable, using" << m_fallback->name();
    }

    bool ok = false;
    const QStringList paths = m_fallback->orderedLogPaths(m_root, &ok);
    if (!ok) {
        qWarning() << "SessionLocator: Could not list sessions under" << m_root;
        return {};
    }
    return paths;
}

SessionDescriptor SessionLocator::describe(const QString &logPath) const
{
    const QFileInfo info(logPath);

    SessionDescriptor descriptor;
    descriptor.logPath = logPath;
    descriptor.sessionId = info.fileName();
    if (descriptor.sessionId.endsWith(LogSuffix)) {
        descriptor.sessionId.chop(LogSuffix.size());
    }
    descriptor.projectDirName = info.dir().dirName();
    descriptor.folder = ProjectPathCodec::decodeProjectDirectory(descriptor.projectDirName);
    descriptor.displayFolder = m_resolver ? m_resolver->mainRepoPath(descriptor.folder) : descriptor.folder;

    descriptor.modified = info.lastModified();
    // Not every filesystem records a birth time
    descriptor.created = info.birthTime();
    if (!descriptor.created.isValid()) {
        descriptor.created = info.metadataChangeTime();
    }
    if (!descriptor.created.isValid()) {
        descriptor.created = descriptor.modified;
    }

    return descriptor;
}

SessionPage SessionLocator::listSessions(int limit, int offset) const
{
    SessionPage page;

    const QStringList paths = orderedLogPaths();
    page.total = static_cast<int>(paths.size());

    const int start = std::max(0, offset);
    if (limit <= 0 || start >= page.total) {
        page.hasMore = false;
        return page;
    }

    // start + limit may not fit in an int
    const int end = (limit >= page.total - start) ? page.total : start + limit;
    for (int i = start; i < end; ++i) {
        page.sessions.append(describe(paths.at(i)));
    }
    page.hasMore = end < page.total;

    return page;
}

} // namespace Callboard
