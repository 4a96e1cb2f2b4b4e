// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_APIENDPOINTS_H
#define REMOTEFS_APIENDPOINTS_H

#include <QList>
#include <QPair>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <optional>
#include "FsTypes.h"
#include "Transport.h"

struct ClientConfig;

/**
 * Builds every request of the file API for one deployment.
 *
 * Scoped deployments address /api/server/{serverId}/fs/..., the legacy
 * single-server deployment addresses /api/filesystem/... and passes the
 * listing path and upload target in headers.
 */
class ApiEndpoints final {
public:
    ApiEndpoints(QUrl baseUrl, QString serverId, bool legacyApi);
    explicit ApiEndpoints(const ClientConfig& config);

    [[nodiscard]] bool isLegacy() const { return m_legacy; }

    [[nodiscard]] ApiRequest listDirectory(const QString& path) const;
    [[nodiscard]] ApiRequest search(const QString& query, bool filenameOnly) const;

    [[nodiscard]] ApiRequest copy() const;
    [[nodiscard]] ApiRequest move() const;
    [[nodiscard]] ApiRequest rename() const;
    [[nodiscard]] ApiRequest remove() const;
    [[nodiscard]] ApiRequest create() const;
    [[nodiscard]] ApiRequest contents(const QString& filepath) const;

    [[nodiscard]] ApiRequest upload(const QString& targetPath, const QString& uploadId) const;
    [[nodiscard]] ApiRequest uploadFromUrl(const QString& url, const QString& filepath) const;
    [[nodiscard]] ApiRequest archive() const;
    [[nodiscard]] ApiRequest extract(const QString& archivePath, const QString& directory, const QString& trackerId) const;

    // Notification channel of a job.
    [[nodiscard]] ApiRequest channel(JobKind kind, const QString& jobId) const;

    // Server-side cancel of a job; std::nullopt for kinds without a cancel endpoint.
    [[nodiscard]] std::optional<ApiRequest> cancel(JobKind kind, const QString& jobId) const;

    // Target of a browser-style download; items are made relative to cwd.
    [[nodiscard]] QUrl download(const QStringList& items, const QString& cwd) const;

private:
    using Query = QList<QPair<QString, QString>>;

    [[nodiscard]] QUrl url(const QString& relative, const Query& query = {}) const;
    [[nodiscard]] ApiRequest jsonRequest(const QString& relative) const;

    QUrl m_base;
    QString m_serverId;
    bool m_legacy = false;
};

#endif //REMOTEFS_APIENDPOINTS_H
