// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QSettings>
#include "ClientConfig.h"

namespace {
    constexpr const char* kGroup = "connection";
}

ClientConfig ClientConfig::load(QSettings& settings) {
    ClientConfig c;

    settings.beginGroup(QString::fromLatin1(kGroup));
    c.baseUrl = QUrl(settings.value(QStringLiteral("baseUrl"), c.baseUrl.toString()).toString());
    c.serverId = settings.value(QStringLiteral("serverId"), c.serverId).toString();
    c.legacyApi = settings.value(QStringLiteral("legacyApi"), c.legacyApi).toBool();
    c.requestTimeoutMs = settings.value(QStringLiteral("requestTimeoutMs"), c.requestTimeoutMs).toInt();
    c.userAgent = settings.value(QStringLiteral("userAgent"), c.userAgent).toString();
    settings.endGroup();

    return c;
}

void ClientConfig::save(QSettings& settings) const {
    settings.beginGroup(QString::fromLatin1(kGroup));
    settings.setValue(QStringLiteral("baseUrl"), baseUrl.toString());
    settings.setValue(QStringLiteral("serverId"), serverId);
    settings.setValue(QStringLiteral("legacyApi"), legacyApi);
    settings.setValue(QStringLiteral("requestTimeoutMs"), requestTimeoutMs);
    settings.setValue(QStringLiteral("userAgent"), userAgent);
    settings.endGroup();
}

bool ClientConfig::validate(QString* errorOut) const {
    if (!baseUrl.isValid() || baseUrl.scheme().isEmpty() || baseUrl.host().isEmpty()) {
        if (errorOut) *errorOut = QStringLiteral("Invalid base URL: \"%1\"").arg(baseUrl.toString());
        return false;
    }
    if (!legacyApi && serverId.trimmed().isEmpty()) {
        if (errorOut) *errorOut = QStringLiteral("No server id configured (use --server, or --legacy for single-server deployments)");
        return false;
    }
    if (requestTimeoutMs < 0) {
        if (errorOut) *errorOut = QStringLiteral("Request timeout must not be negative");
        return false;
    }
    return true;
}
