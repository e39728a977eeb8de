/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef REPOSITORYINSPECTOR_H
#define REPOSITORYINSPECTOR_H

#include "callboard_export.h"

#include <QString>
#include <QStringList>

namespace Callboard
{

/**
 * Version control status of a directory
 */
struct CALLBOARD_EXPORT RepositoryStatus {
    bool isRepo = false;
    QString branch;

    bool operator==(const RepositoryStatus &other) const
    {
        return isRepo == other.isRepo && branch == other.branch;
    }
};

/**
 * Result of resolving a checkout to its main repository directory
 */
struct CALLBOARD_EXPORT WorktreeResolution {
    QString mainRepoPath;
    bool isWorktree = false;
};

/**
 * RepositoryInspector answers version control questions about directories.
 *
 * Implementations may be slow (they usually spawn processes) and may throw
 * std::exception; callers cache results and catch failures.
 */
class CALLBOARD_EXPORT RepositoryInspector
{
public:
    virtual ~RepositoryInspector() = default;

    virtual RepositoryStatus repositoryStatus(const QString &directory) const = 0;

    virtual WorktreeResolution resolveWorktree(const QString &directory) const = 0;
};

/**
 * RepositoryInspector backed by the git command line tool
 */
class CALLBOARD_EXPORT GitRepositoryInspector : public RepositoryInspector
{
public:
    GitRepositoryInspector() = default;
    ~GitRepositoryInspector() override = default;

    /**
     * Check if git is available on the system
     */
    static bool isAvailable();

    RepositoryStatus repositoryStatus(const QString &directory) const override;

    /**
     * A linked worktree has a git dir different from its common dir; the
     * main checkout is the parent of the common ".git" directory.
     */
    WorktreeResolution resolveWorktree(const QString &directory) const override;

    static constexpr int CommandTimeoutMs = 5000;

private:
    /**
     * Run git in @p directory and return trimmed stdout
     */
    QString executeCommand(const QString &directory, const QStringList &args, bool *ok = nullptr) const;
};

} // namespace Callboard

#endif // REPOSITORYINSPECTOR_H
