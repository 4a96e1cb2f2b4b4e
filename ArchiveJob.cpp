// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>
#include <QJsonArray>
#include <QJsonDocument>
#include "ArchiveJob.h"
#include "ApiClient.h"
#include "EntryNormalizer.h"
#include "Logging.h"

ArchiveJob::ArchiveJob(ApiClient* client, const QString& archiveName, const QStringList& entries, const QString& cwd, QObject* parent)
    : Job(client, JobKind::Archive, archiveName + u'-' + ApiClient::newToken(), parent)
    , m_archiveName(archiveName)
    , m_cwd(EntryNormalizer::stripLeadingSeparator(cwd)) {
    m_entries.reserve(entries.size());
    for (const QString& e : entries) {
        m_entries << EntryNormalizer::stripLeadingSeparator(e);
    }
}

void ArchiveJob::channelOpened() {
    reportProgress(JobProgress{});
}

ApiReply* ArchiveJob::trigger() {
    QJsonObject body;
    body.insert(QStringLiteral("entries"), QJsonArray::fromStringList(m_entries));
    body.insert(QStringLiteral("cwd"), m_cwd);
    body.insert(QStringLiteral("filename"), m_archiveName);
    body.insert(QStringLiteral("tracker_id"), jobId());

    qCInfo(lcJobs) << "Archiving" << m_entries.size() << "entries into" << m_archiveName << "as" << jobId();
    return client()->transport()->post(client()->endpoints().archive(),
                                       QJsonDocument(body).toJson(QJsonDocument::Compact));
}

void ArchiveJob::handleEvent(const QString& status, const QJsonObject& payload) {
    if (status != QStringLiteral("progress")) {
        qCDebug(lcJobs) << "Unhandled archive event" << status << "for" << jobId();
        return;
    }

    JobProgress p;
    p.percent = std::clamp(payload.value(QStringLiteral("progress")).toDouble(), 0.0, 100.0);
    reportProgress(p);
}
