// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QJsonArray>
#include <QJsonDocument>
#include "ApiEndpoints.h"
#include "ClientConfig.h"

namespace {
    QString encodeSegment(const QString& segment) {
        return QString::fromLatin1(QUrl::toPercentEncoding(segment));
    }
}

ApiEndpoints::ApiEndpoints(QUrl baseUrl, QString serverId, bool legacyApi)
    : m_base(std::move(baseUrl)), m_serverId(std::move(serverId)), m_legacy(legacyApi) {}

ApiEndpoints::ApiEndpoints(const ClientConfig& config)
    : ApiEndpoints(config.baseUrl, config.serverId, config.legacyApi) {}

QUrl ApiEndpoints::url(const QString& relative, const Query& query) const {
    QString basePath = m_base.path();
    while (basePath.endsWith(u'/')) basePath.chop(1);

    const QString prefix = m_legacy
        ? QStringLiteral("/api/filesystem/")
        : QStringLiteral("/api/server/%1/fs/").arg(encodeSegment(m_serverId));

    QUrl out = m_base;
    out.setPath(basePath + prefix + relative, QUrl::StrictMode);

    if (!query.isEmpty()) {
        QStringList parts;
        parts.reserve(query.size());
        for (const auto& [key, value] : query) {
            parts << encodeSegment(key) + u'=' + encodeSegment(value);
        }
        out.setQuery(parts.join(u'&'), QUrl::StrictMode);
    } else {
        out.setQuery(QString());
    }
    return out;
}

ApiRequest ApiEndpoints::jsonRequest(const QString& relative) const {
    ApiRequest r;
    r.url = url(relative);
    r.contentType = QByteArrayLiteral("application/json");
    return r;
}

ApiRequest ApiEndpoints::listDirectory(const QString& path) const {
    ApiRequest r;
    if (m_legacy) {
        r.url = url(QString());
        r.headers.append({QByteArrayLiteral("X-Filesystem-Path"), path.toUtf8()});
    } else {
        r.url = url(QStringLiteral("files"), {{QStringLiteral("path"), path}});
    }
    return r;
}

ApiRequest ApiEndpoints::search(const QString& query, bool filenameOnly) const {
    ApiRequest r;
    r.url = url(QStringLiteral("search"), {
        {QStringLiteral("q"), query},
        {QStringLiteral("filename_only"), filenameOnly ? QStringLiteral("true") : QStringLiteral("false")},
    });
    return r;
}

ApiRequest ApiEndpoints::copy() const { return jsonRequest(QStringLiteral("copy")); }
ApiRequest ApiEndpoints::move() const { return jsonRequest(QStringLiteral("move")); }
ApiRequest ApiEndpoints::rename() const { return jsonRequest(QStringLiteral("rename")); }
ApiRequest ApiEndpoints::remove() const { return jsonRequest(QString()); }
ApiRequest ApiEndpoints::create() const { return jsonRequest(QStringLiteral("new")); }

ApiRequest ApiEndpoints::contents(const QString& filepath) const {
    ApiRequest r;
    r.url = url(QStringLiteral("contents"), {{QStringLiteral("filepath"), filepath}});
    r.contentType = QByteArrayLiteral("text/plain; charset=utf-8");
    return r;
}

ApiRequest ApiEndpoints::upload(const QString& targetPath, const QString& uploadId) const {
    ApiRequest r;
    if (m_legacy) {
        r.url = url(QStringLiteral("upload"));
        r.headers.append({QByteArrayLiteral("X-Filesystem-Path"), targetPath.toUtf8()});
        r.headers.append({QByteArrayLiteral("X-Upload-ID"), uploadId.toUtf8()});
    } else {
        r.url = url(QStringLiteral("upload"), {
            {QStringLiteral("path"), targetPath},
            {QStringLiteral("upload_id"), uploadId},
        });
    }
    r.contentType = QByteArrayLiteral("application/octet-stream");
    return r;
}

ApiRequest ApiEndpoints::uploadFromUrl(const QString& sourceUrl, const QString& filepath) const {
    ApiRequest r;
    r.url = url(QStringLiteral("upload-url"), {
        {QStringLiteral("url"), sourceUrl},
        {QStringLiteral("filepath"), filepath},
    });
    return r;
}

ApiRequest ApiEndpoints::archive() const { return jsonRequest(QStringLiteral("archive")); }

ApiRequest ApiEndpoints::extract(const QString& archivePath, const QString& directory, const QString& trackerId) const {
    ApiRequest r;
    r.url = url(QStringLiteral("extract"), {
        {QStringLiteral("archive"), archivePath},
        {QStringLiteral("directory"), directory},
        {QStringLiteral("tracker"), trackerId},
    });
    return r;
}

ApiRequest ApiEndpoints::channel(JobKind kind, const QString& jobId) const {
    ApiRequest r;
    switch (kind) {
        case JobKind::Upload:
            r.url = url(QStringLiteral("upload/progress/") + encodeSegment(jobId));
            break;
        case JobKind::Archive:
            r.url = url(QStringLiteral("archive/status/") + encodeSegment(jobId));
            break;
        case JobKind::Extract:
            r.url = url(QStringLiteral("extract/status/") + encodeSegment(jobId));
            break;
        case JobKind::UrlUpload:
            // The job id is client-side only; the request itself is the channel.
            break;
    }
    return r;
}

std::optional<ApiRequest> ApiEndpoints::cancel(JobKind kind, const QString& jobId) const {
    ApiRequest r;
    switch (kind) {
        case JobKind::Upload:
            r.url = url(QStringLiteral("upload/cancel/") + encodeSegment(jobId));
            return r;
        case JobKind::Archive:
            r.url = url(QStringLiteral("archive/cancel/") + encodeSegment(jobId));
            return r;
        case JobKind::Extract:
            r.url = url(QStringLiteral("extract/cancel/") + encodeSegment(jobId));
            return r;
        case JobKind::UrlUpload:
            return std::nullopt;
    }
    return std::nullopt;
}

QUrl ApiEndpoints::download(const QStringList& items, const QString& cwd) const {
    QJsonArray relative;
    for (const QString& item : items) {
        QString rel = item;
        if (!cwd.isEmpty() && cwd != QStringLiteral("/") && rel.startsWith(cwd)) {
            rel = rel.mid(cwd.size());
        }
        relative.append(rel);
    }

    const QString itemsJson = QString::fromUtf8(QJsonDocument(relative).toJson(QJsonDocument::Compact));
    return url(QStringLiteral("download"), {
        {QStringLiteral("items"), itemsJson},
        {QStringLiteral("cwd"), cwd},
    });
}
