/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef CALLBOARD_SETTINGS_H
#define CALLBOARD_SETTINGS_H

#include "callboard_export.h"

#include <QObject>
#include <QString>

#include <KSharedConfig>

namespace Callboard
{

/**
 * CallboardSettings manages the settings stored in callboardrc.
 *
 * Settings include:
 * - Session log store root
 * - Callboard data directory (chat records)
 * - Session listing strategy, page size and preview length
 * - Repository status cache TTL
 */
class CALLBOARD_EXPORT CallboardSettings : public QObject
{
    Q_OBJECT

public:
    static CallboardSettings *instance();

    explicit CallboardSettings(QObject *parent = nullptr);
    ~CallboardSettings() override;

    /**
     * Root of the session logs (e.g., ~/.claude/projects)
     */
    QString projectsDirectory() const;
    void setProjectsDirectory(const QString &path);

    /**
     * Where chat records live (e.g., ~/.callboard)
     */
    QString dataDirectory() const;
    void setDataDirectory(const QString &path);

    /**
     * Session listing strategy: "auto", "find" or "scan"
     */
    QString listingStrategy() const;
    void setListingStrategy(const QString &strategy);

    int pageSize() const;
    void setPageSize(int size);

    int previewLength() const;
    void setPreviewLength(int length);

    /**
     * Repository status cache TTL in seconds (default: 300)
     */
    int statusTtlSeconds() const;
    void setStatusTtlSeconds(int seconds);

    /**
     * Save settings to disk
     */
    void save();

Q_SIGNALS:
    void settingsChanged();

private:
    static CallboardSettings *s_instance;

    KSharedConfig::Ptr m_config;
};

} // namespace Callboard

#endif // CALLBOARD_SETTINGS_H
