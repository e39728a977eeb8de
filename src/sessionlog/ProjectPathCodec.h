/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PROJECTPATHCODEC_H
#define PROJECTPATHCODEC_H

#include "callboard_export.h"

#include <QString>
#include <QStringList>

namespace Callboard
{

/**
 * ProjectPathCodec converts between a working directory and the name of
 * its folder in the session log store.
 *
 * The encoding replaces every non-alphanumeric character with '-', so
 * "/home/me/my.app" and "/home/me/my/app" collide. Decoding therefore
 * consults the filesystem:
 *
 * 1. Walk the dashes left to right, turning a dash into '/' whenever the
 *    prefix built so far is an existing directory.
 * 2. If that path does not exist, try putting dots back: inside a segment,
 *    by merging trailing segments with dots (or mixed dot/slash), then both.
 * 3. Otherwise return the greedy result as best effort.
 */
class CALLBOARD_EXPORT ProjectPathCodec
{
public:
    static QString encodeProjectDirectory(const QString &path);

    static QString decodeProjectDirectory(const QString &dirName);

    /**
     * Variants of @p segment with some or all dashes turned into dots,
     * all-dots first, never the unchanged segment.
     */
    static QStringList dotVariants(const QString &segment);

private:
    static QString tryDotRecovery(const QStringList &segments);
};

} // namespace Callboard

#endif // PROJECTPATHCODEC_H
