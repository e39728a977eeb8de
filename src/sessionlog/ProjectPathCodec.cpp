/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ProjectPathCodec.h"

#include <QFileInfo>
#include <QList>

#include <algorithm>

namespace Callboard
{

static bool isDirectory(const QString &path)
{
    return QFileInfo(path).isDir();
}

static bool pathExists(const QString &path)
{
    return QFileInfo::exists(path);
}

static QString joinAbsolute(const QStringList &segments)
{
    return QStringLiteral("/") + segments.join(QLatin1Char('/'));
}

QString ProjectPathCodec::encodeProjectDirectory(const QString &path)
{
    QString encoded = path;
    for (QChar &ch : encoded) {
        const char16_t c = ch.unicode();
        const bool alnum = (c >= u'a' && c <= u'z') || (c >= u'A' && c <= u'Z') || (c >= u'0' && c <= u'9');
        if (!alnum) {
            ch = QLatin1Char('-');
        }
    }
    return encoded;
}

QStringList ProjectPathCodec::dotVariants(const QString &segment)
{
    QList<int> dashPositions;
    for (int i = 0; i < segment.size(); ++i) {
        if (segment.at(i) == QLatin1Char('-')) {
            dashPositions.append(i);
        }
    }

    if (dashPositions.isEmpty()) {
        return {};
    }

    QString allDots = segment;
    allDots.replace(QLatin1Char('-'), QLatin1Char('.'));

    // Too many combinations to probe
    if (dashPositions.size() > 6) {
        return {allDots};
    }

    QStringList variants;
    variants.append(allDots);

    const int combinations = 1 << dashPositions.size();
    for (int mask = 1; mask < combinations - 1; ++mask) {
        QString variant = segment;
        for (int i = 0; i < dashPositions.size(); ++i) {
            if (mask & (1 << i)) {
                variant[dashPositions.at(i)] = QLatin1Char('.');
            }
        }
        variants.append(variant);
    }

    return variants;
}

QString ProjectPathCodec::tryDotRecovery(const QStringList &segments)
{
    // Dots inside a single segment, rightmost first
    for (int segIdx = segments.size() - 1; segIdx >= 0; --segIdx) {
        const QString &segment = segments.at(segIdx);
        if (!segment.contains(QLatin1Char('-'))) {
            continue;
        }

        const QStringList variants = dotVariants(segment);
        for (const QString &variant : variants) {
            QStringList candidate = segments;
            candidate[segIdx] = variant;
            const QString path = joinAbsolute(candidate);
            if (pathExists(path)) {
                return path;
            }
        }
    }

    // Trailing segments the greedy pass split apart that were really joined by dots
    if (segments.size() >= 2) {
        const int maxMerge = std::min<int>(segments.size(), 6);
        for (int mergeCount = 2; mergeCount <= maxMerge; ++mergeCount) {
            const QStringList prefix = segments.mid(0, segments.size() - mergeCount);
            const QStringList merge = segments.mid(segments.size() - mergeCount);
            const QString prefixPath = prefix.isEmpty() ? QString() : joinAbsolute(prefix);

            const QString allDots = prefixPath + QLatin1Char('/') + merge.join(QLatin1Char('.'));
            if (pathExists(allDots)) {
                return allDots;
            }

            if (mergeCount <= 4) {
                const int separators = mergeCount - 1;
                const int combinations = 1 << separators;
                // 0 is all slashes (the original) and combinations - 1 is all dots (tried above)
                for (int mask = 1; mask < combinations - 1; ++mask) {
                    QString merged = merge.at(0);
                    for (int i = 0; i < separators; ++i) {
                        merged += (mask & (1 << i)) ? QLatin1Char('.') : QLatin1Char('/');
                        merged += merge.at(i + 1);
                    }
                    const QString path = prefixPath + QLatin1Char('/') + merged;
                    if (pathExists(path)) {
                        return path;
                    }
                }
            }
        }
    }

    // Both: merge with dots, then dot the remaining dashes
    if (segments.size() >= 2) {
        const int maxMerge = std::min<int>(segments.size(), 4);
        for (int mergeCount = 2; mergeCount <= maxMerge; ++mergeCount) {
            const QStringList prefix = segments.mid(0, segments.size() - mergeCount);
            const QStringList merge = segments.mid(segments.size() - mergeCount);
            const QString prefixPath = prefix.isEmpty() ? QString() : joinAbsolute(prefix);

            const QString dotJoined = merge.join(QLatin1Char('.'));
            if (!dotJoined.contains(QLatin1Char('-'))) {
                continue;
            }
            const QStringList variants = dotVariants(dotJoined);
            for (const QString &variant : variants) {
                const QString path = prefixPath + QLatin1Char('/') + variant;
                if (pathExists(path)) {
                    return path;
                }
            }
        }
    }

    return QString();
}

QString ProjectPathCodec::decodeProjectDirectory(const QString &dirName)
{
    const QString body = dirName.startsWith(QLatin1Char('-')) ? dirName.mid(1) : dirName;
    if (body.isEmpty()) {
        return QStringLiteral("/");
    }

    const QStringList parts = body.split(QLatin1Char('-'));

    QStringList resolvedSegments;
    QString currentSegment = parts.at(0);

    for (int i = 1; i < parts.size(); ++i) {
        QStringList candidate = resolvedSegments;
        candidate.append(currentSegment);
        if (isDirectory(joinAbsolute(candidate))) {
            resolvedSegments.append(currentSegment);
            currentSegment = parts.at(i);
        } else {
            currentSegment += QLatin1Char('-');
            currentSegment += parts.at(i);
        }
    }
    resolvedSegments.append(currentSegment);

    const QString resolved = joinAbsolute(resolvedSegments);
    if (pathExists(resolved)) {
        return resolved;
    }

    const QString recovered = tryDotRecovery(resolvedSegments);
    if (!recovered.isEmpty()) {
        return recovered;
    }

    return resolved;
}

} // namespace Callboard
