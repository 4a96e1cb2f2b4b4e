// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_FSTYPES_H
#define REMOTEFS_FSTYPES_H

#include <QList>
#include <QMetaType>
#include <QString>
#include <optional>

/**
 * A file or directory as exposed to collaborators.
 *
 * Only EntryNormalizer builds these from server payloads, so every Entry
 * already carries forward-slash paths, millisecond timestamps and a type label.
 */
struct Entry {
    QString name;
    QString path;
    quint64 size = 0;
    bool isDirectory = false;
    std::optional<qint64> createdAt;  // ms since epoch
    std::optional<qint64> modifiedAt; // ms since epoch
    QString typeLabel;

    bool operator==(const Entry& o) const = default;
};

struct Listing {
    std::optional<QString> parentPath; // nullopt at the root
    QString currentPath;
    QList<Entry> entries;
};

enum class JobKind : quint8 { Upload, Archive, Extract, UrlUpload };

/**
 * Progress snapshot of a running job.
 *
 * Uploads fill the byte fields, archive/extract fill percent and (extract only)
 * the file counters, URL uploads fill percent plus the byte fields.
 */
struct JobProgress {
    double percent = 0.0;
    std::optional<quint64> bytesTransferred;
    std::optional<quint64> totalBytes;
    std::optional<quint64> filesProcessed;
    std::optional<quint64> totalFiles;
};

[[nodiscard]] QString jobKindName(JobKind kind);

Q_DECLARE_METATYPE(Entry)
Q_DECLARE_METATYPE(Listing)
Q_DECLARE_METATYPE(JobProgress)

#endif //REMOTEFS_FSTYPES_H
