/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "RepositoryInspector.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

namespace Callboard
{

bool GitRepositoryInspector::isAvailable()
{
    return !QStandardPaths::findExecutable(QStringLiteral("git")).isEmpty();
}

QString GitRepositoryInspector::executeCommand(const QString &directory, const QStringList &args, bool *ok) const
{
    QProcess process;
    process.setWorkingDirectory(directory);
    process.start(QStringLiteral("git"), args);

    if (!process.waitForFinished(CommandTimeoutMs)) {
        process.kill();
        process.waitForFinished(1000);
        if (ok) *ok = false;
        return QString();
    }

    const bool success = process.exitStatus() == QProcess::NormalExit && process.exitCode() == 0;
    if (ok) {
        *ok = success;
    }

    return QString::fromUtf8(process.readAllStandardOutput()).trimmed();
}

RepositoryStatus GitRepositoryInspector::repositoryStatus(const QString &directory) const
{
    RepositoryStatus status;

    const QFileInfo info(directory);
    if (directory.isEmpty() || !info.exists() || !info.isDir()) {
        return status;
    }

    bool isRepo = QFileInfo::exists(QDir(directory).filePath(QStringLiteral(".git")));
    if (!isRepo) {
        // Might be nested inside a repository
        executeCommand(directory, {QStringLiteral("rev-parse"), QStringLiteral("--git-dir")}, &isRepo);
    }
    if (!isRepo) {
        return status;
    }

    status.isRepo = true;

    bool ok = false;
    const QString branch = executeCommand(directory, {QStringLiteral("branch"), QStringLiteral("--show-current")}, &ok);
    // Detached HEAD or an unreadable ref still reports a branch
    status.branch = (ok && !branch.isEmpty()) ? branch : QStringLiteral("main");

    return status;
}

WorktreeResolution GitRepositoryInspector::resolveWorktree(const QString &directory) const
{
    WorktreeResolution resolution;
    resolution.mainRepoPath = directory;

    if (directory.isEmpty() || !QFileInfo(directory).isDir()) {
        return resolution;
    }

    bool ok = false;
    const QString output = executeCommand(directory,
                                          {QStringLiteral("rev-parse"),
                                           QStringLiteral("--path-format=absolute"),
                                           QStringLiteral("--git-dir"),
                                           QStringLiteral("--git-common-dir")},
                                          &ok);
    if (!ok) {
        return resolution;
    }

    const QStringList lines = output.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    if (lines.size() < 2) {
        return resolution;
    }

    const QString gitDir = QDir::cleanPath(lines.at(0).trimmed());
    const QString commonDir = QDir::cleanPath(lines.at(1).trimmed());
    if (gitDir == commonDir) {
        return resolution;
    }

    const QFileInfo commonInfo(commonDir);
    if (commonInfo.fileName() != QLatin1String(".git")) {
        // Bare repository: no main checkout to point at
        return resolution;
    }

    resolution.mainRepoPath = commonInfo.absolutePath();
    resolution.isWorktree = true;
    qDebug() << "GitRepositoryInspector: Resolved worktree" << directory << "->" << resolution.mainRepoPath;
    return resolution;
}

} // namespace Callboard
