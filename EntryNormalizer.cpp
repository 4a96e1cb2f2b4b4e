// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QJsonArray>
#include "EntryNormalizer.h"
#include "FileTypes.h"

namespace {
    QString nameFrom(const QJsonObject& raw) {
        QString name = raw.value(QStringLiteral("filename")).toString();
        if (name.isEmpty()) name = raw.value(QStringLiteral("name")).toString();
        return name;
    }

    quint64 sizeFrom(const QJsonObject& raw) {
        const double size = raw.value(QStringLiteral("size")).toDouble(0.0);
        return size > 0.0 ? static_cast<quint64>(size) : 0;
    }
}

namespace EntryNormalizer {
    std::optional<qint64> timestampFromWire(const QJsonValue& value) {
        if (!value.isObject()) return std::nullopt;

        const QJsonObject o = value.toObject();
        const qint64 secs = static_cast<qint64>(o.value(QStringLiteral("secs_since_epoch")).toDouble(0.0));
        const qint64 nanos = static_cast<qint64>(o.value(QStringLiteral("nanos_since_epoch")).toDouble(0.0));
        return secs * 1000 + nanos / 1'000'000;
    }

    QString normalizePath(const QString& rawPath) {
        QString path = rawPath;
        if (path.startsWith(u'\\')) path.remove(0, 1);
        path.replace(u'\\', u'/');
        return path;
    }

    QString stripLeadingSeparator(const QString& path) {
        if (path.startsWith(u'/') || path.startsWith(u'\\')) return path.mid(1);
        return path;
    }

    QString joinPath(const QString& directory, const QString& name) {
        if (directory.isEmpty()) return name;

        QString dir = directory;
        while (dir.size() > 1 && dir.endsWith(u'/')) dir.chop(1);

        QString leaf = name;
        while (leaf.startsWith(u'/')) leaf.remove(0, 1);

        if (dir == QStringLiteral("/")) return dir + leaf;
        return dir + u'/' + leaf;
    }

    std::optional<Entry> normalizeEntry(const QJsonObject& raw, QString* errorOut) {
        const QString name = nameFrom(raw);
        if (name.isEmpty()) {
            if (errorOut) *errorOut = QStringLiteral("Entry has no filename");
            return std::nullopt;
        }

        Entry e;
        e.name = name;
        e.path = normalizePath(raw.value(QStringLiteral("path")).toString());
        e.size = sizeFrom(raw);
        e.isDirectory = raw.value(QStringLiteral("is_dir")).toBool(false);
        e.createdAt = timestampFromWire(raw.value(QStringLiteral("created")));
        e.modifiedAt = timestampFromWire(raw.value(QStringLiteral("last_modified")));
        e.typeLabel = FileTypes::typeLabelFor(e.name, e.isDirectory);
        return e;
    }

    std::optional<Entry> normalizeSearchHit(const QJsonObject& raw, QString* errorOut) {
        const QString name = nameFrom(raw);
        if (name.isEmpty()) {
            if (errorOut) *errorOut = QStringLiteral("Search result has no filename");
            return std::nullopt;
        }

        auto secondsToMs = [&](const QString& key) -> std::optional<qint64> {
            const QJsonValue v = raw.value(key);
            if (!v.isDouble()) return std::nullopt;
            return static_cast<qint64>(v.toDouble()) * 1000;
        };

        Entry e;
        e.name = name;
        e.path = normalizePath(raw.value(QStringLiteral("path")).toString());
        e.size = sizeFrom(raw);
        e.isDirectory = raw.value(QStringLiteral("is_dir")).toBool(false);
        e.createdAt = secondsToMs(QStringLiteral("ctime"));
        e.modifiedAt = secondsToMs(QStringLiteral("mtime"));
        e.typeLabel = FileTypes::typeLabelFor(e.name, e.isDirectory);
        return e;
    }

    Entry normalize(const Entry& entry) {
        Entry out = entry;
        out.path = normalizePath(entry.path);
        out.typeLabel = FileTypes::typeLabelFor(entry.name, entry.isDirectory);
        return out;
    }

    std::optional<Listing> normalizeListing(const QJsonObject& raw, QString* errorOut) {
        const QJsonValue entriesValue = raw.value(QStringLiteral("entries"));
        if (!entriesValue.isArray()) {
            if (errorOut) *errorOut = QStringLiteral("Directory listing has no entries array");
            return std::nullopt;
        }

        Listing listing;

        const QJsonValue parent = raw.value(QStringLiteral("parent"));
        if (parent.isString()) listing.parentPath = normalizePath(parent.toString());

        listing.currentPath = normalizePath(raw.value(QStringLiteral("current_path")).toString());

        const QJsonArray entries = entriesValue.toArray();
        listing.entries.reserve(entries.size());
        for (const QJsonValue& v : entries) {
            auto entry = normalizeEntry(v.toObject());
            if (!entry) continue;
            listing.entries.push_back(*entry);
        }

        return listing;
    }
}
