// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_ENTRYNORMALIZER_H
#define REMOTEFS_ENTRYNORMALIZER_H

#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <optional>
#include "FsTypes.h"

/**
 * Decoding layer between the server's loosely typed records and Entry/Listing.
 *
 * Everything here is pure: no I/O, no logging side effects the caller depends on.
 */
namespace EntryNormalizer {
    /**
     * Converts a {secs_since_epoch, nanos_since_epoch} object into milliseconds.
     *
     * @param value The raw JSON value. Undefined, null or non-object values yield std::nullopt
     *              so an absent timestamp is never replaced by "now".
     * @return secs * 1000 + nanos / 1'000'000, or std::nullopt.
     */
    [[nodiscard]] std::optional<qint64> timestampFromWire(const QJsonValue& value);

    // Strips one leading backslash, then converts remaining backslashes to forward slashes.
    [[nodiscard]] QString normalizePath(const QString& rawPath);

    // Strips one leading '/' or '\' so the path is relative to the server root.
    [[nodiscard]] QString stripLeadingSeparator(const QString& path);

    // Joins a directory and a name with exactly one '/' between them.
    [[nodiscard]] QString joinPath(const QString& directory, const QString& name);

    /**
     * Converts one raw directory entry into an Entry.
     *
     * Accepts the listing record shape:
     *   {filename, path, size, is_dir, created?, last_modified?}
     * where the timestamps are {secs_since_epoch, nanos_since_epoch} objects.
     *
     * @param raw The JSON object received from the server.
     * @param errorOut Receives a description when the record has no usable name.
     * @return The canonical Entry, or std::nullopt when the record is unusable.
     */
    std::optional<Entry> normalizeEntry(const QJsonObject& raw, QString* errorOut = nullptr);

    // Search hits carry {filename, path, size, ctime, mtime} with timestamps in plain seconds.
    std::optional<Entry> normalizeSearchHit(const QJsonObject& raw, QString* errorOut = nullptr);

    // Re-applies the path and type rules; a no-op for entries produced by this namespace.
    [[nodiscard]] Entry normalize(const Entry& entry);

    /**
     * Converts a {parent, current_path, entries[]} document into a Listing.
     * Unusable entries are skipped; a document without an entries array is an error.
     */
    std::optional<Listing> normalizeListing(const QJsonObject& raw, QString* errorOut = nullptr);
}

#endif //REMOTEFS_ENTRYNORMALIZER_H
