// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_CLIENTCONFIG_H
#define REMOTEFS_CLIENTCONFIG_H

#include <QString>
#include <QUrl>

class QSettings;

struct ClientConfig {
    QUrl baseUrl = QUrl(QStringLiteral("http://127.0.0.1:8080"));
    QString serverId;       // empty with legacyApi = true
    bool legacyApi = false; // single-server deployment without /api/server/{id}
    int requestTimeoutMs = 30000;
    QString userAgent;

    /**
     * Reads the [connection] group. Missing keys keep their defaults.
     */
    static ClientConfig load(QSettings& settings);
    void save(QSettings& settings) const;

    /**
     * Checks that the configuration can address the API.
     *
     * @param errorOut Receives a human-readable reason when the config is unusable.
     * @return true when a base URL is set and the deployment mode has what it needs.
     */
    bool validate(QString* errorOut = nullptr) const;
};

#endif //REMOTEFS_CLIENTCONFIG_H
