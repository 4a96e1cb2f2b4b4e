// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>
#include "ExtractJob.h"
#include "ApiClient.h"
#include "EntryNormalizer.h"
#include "Logging.h"

ExtractJob::ExtractJob(ApiClient* client, const QString& archivePath, const QString& outputDirectory, QObject* parent)
    : Job(client, JobKind::Extract, ApiClient::newToken(), parent)
    , m_archivePath(EntryNormalizer::stripLeadingSeparator(archivePath))
    , m_outputDirectory(EntryNormalizer::stripLeadingSeparator(outputDirectory)) {}

void ExtractJob::channelOpened() {
    reportProgress(JobProgress{});
}

ApiReply* ExtractJob::trigger() {
    qCInfo(lcJobs) << "Extracting" << m_archivePath << "into" << m_outputDirectory << "as" << jobId();
    return client()->transport()->post(client()->endpoints().extract(m_archivePath, m_outputDirectory, jobId()),
                                       QByteArray());
}

void ExtractJob::handleEvent(const QString& status, const QJsonObject& payload) {
    if (status != QStringLiteral("progress")) {
        qCDebug(lcJobs) << "Unhandled extract event" << status << "for" << jobId();
        return;
    }

    JobProgress p;
    p.percent = std::clamp(payload.value(QStringLiteral("progress")).toDouble(), 0.0, 100.0);
    if (payload.contains(QStringLiteral("filesProcessed"))) {
        p.filesProcessed = static_cast<quint64>(payload.value(QStringLiteral("filesProcessed")).toDouble());
    }
    if (payload.contains(QStringLiteral("totalFiles"))) {
        p.totalFiles = static_cast<quint64>(payload.value(QStringLiteral("totalFiles")).toDouble());
    }
    reportProgress(p);
}
