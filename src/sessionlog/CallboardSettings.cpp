/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "CallboardSettings.h"

#include "DirectoryStatusCache.h"
#include "SessionLocator.h"
#include "SessionLogStore.h"

#include <KConfigGroup>
#include <QDir>

namespace Callboard
{

CallboardSettings *CallboardSettings::s_instance = nullptr;

CallboardSettings *CallboardSettings::instance()
{
    return s_instance;
}

CallboardSettings::CallboardSettings(QObject *parent)
    : QObject(parent)
{
    if (!s_instance) {
        s_instance = this;
    }

    // Load config from ~/.config/callboardrc
    m_config = KSharedConfig::openConfig(QStringLiteral("callboardrc"));
}

CallboardSettings::~CallboardSettings()
{
    save();
    if (s_instance == this) {
        s_instance = nullptr;
    }
}

QString CallboardSettings::projectsDirectory() const
{
    KConfigGroup group(m_config, QStringLiteral("Paths"));
    QString defaultRoot = QDir::homePath() + QStringLiteral("/.claude/projects");
    return group.readEntry("ProjectsDirectory", defaultRoot);
}

void CallboardSettings::setProjectsDirectory(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("Paths"));
    group.writeEntry("ProjectsDirectory", path);
    Q_EMIT settingsChanged();
}

QString CallboardSettings::dataDirectory() const
{
    KConfigGroup group(m_config, QStringLiteral("Paths"));
    QString defaultDir = QDir::homePath() + QStringLiteral("/.callboard");
    return group.readEntry("DataDirectory", defaultDir);
}

void CallboardSettings::setDataDirectory(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("Paths"));
    group.writeEntry("DataDirectory", path);
    Q_EMIT settingsChanged();
}

QString CallboardSettings::listingStrategy() const
{
    KConfigGroup group(m_config, QStringLiteral("Listing"));
    const QString strategy = group.readEntry("Strategy", QStringLiteral("auto"));
    // Unknown values behave like auto
    return SessionLocator::modeToString(SessionLocator::modeFromString(strategy));
}

void CallboardSettings::setListingStrategy(const QString &strategy)
{
    KConfigGroup group(m_config, QStringLiteral("Listing"));
    group.writeEntry("Strategy", strategy);
    Q_EMIT settingsChanged();
}

int CallboardSettings::pageSize() const
{
    KConfigGroup group(m_config, QStringLiteral("Listing"));
    const int size = group.readEntry("PageSize", 20);
    return size > 0 ? size : 20;
}

void CallboardSettings::setPageSize(int size)
{
    KConfigGroup group(m_config, QStringLiteral("Listing"));
    group.writeEntry("PageSize", size);
    Q_EMIT settingsChanged();
}

int CallboardSettings::previewLength() const
{
    KConfigGroup group(m_config, QStringLiteral("Listing"));
    return group.readEntry("PreviewLength", SessionLogStore::DefaultPreviewLength);
}

void CallboardSettings::setPreviewLength(int length)
{
    KConfigGroup group(m_config, QStringLiteral("Listing"));
    group.writeEntry("PreviewLength", length);
    Q_EMIT settingsChanged();
}

int CallboardSettings::statusTtlSeconds() const
{
    KConfigGroup group(m_config, QStringLiteral("Cache"));
    return group.readEntry("StatusTtlSeconds", static_cast<int>(DirectoryStatusCache::DefaultTtlMs / 1000));
}

void CallboardSettings::setStatusTtlSeconds(int seconds)
{
    KConfigGroup group(m_config, QStringLiteral("Cache"));
    group.writeEntry("StatusTtlSeconds", seconds);
    Q_EMIT settingsChanged();
}

void CallboardSettings::save()
{
    m_config->sync();
}

} // namespace Callboard

#include "moc_CallboardSettings.cpp"
