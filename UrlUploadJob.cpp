// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>
#include "UrlUploadJob.h"
#include "ApiClient.h"
#include "Logging.h"

UrlUploadJob::UrlUploadJob(ApiClient* client, const QString& sourceUrl, const QString& filepath, QObject* parent)
    : Job(client, JobKind::UrlUpload, ApiClient::newToken(), parent)
    , m_sourceUrl(sourceUrl)
    , m_filepath(filepath)
    , m_accepted(std::make_shared<QPromise<void>>()) {
    m_accepted->start();
    connect(this, &Job::finished, this, &UrlUploadJob::settleAccepted);
}

ApiRequest UrlUploadJob::channelRequest() const {
    return client()->endpoints().uploadFromUrl(m_sourceUrl, m_filepath);
}

void UrlUploadJob::channelOpened() {
    qCInfo(lcJobs) << "Server accepted download of" << m_sourceUrl << "into" << m_filepath;
    settleAccepted();
}

void UrlUploadJob::settleAccepted() {
    if (m_accepted->future().isFinished()) return;

    if (state() == State::Failed && error()) {
        m_accepted->setException(*error());
    }
    m_accepted->finish();
}

QFuture<bool> UrlUploadJob::cancel() {
    QPromise<bool> done;
    done.start();
    done.addResult(!isTerminal());

    if (!isTerminal()) {
        qCInfo(lcJobs) << "Closing download channel of" << jobId();
        markCancelled();
    }

    done.finish();
    return done.future();
}

void UrlUploadJob::handleEvent(const QString& status, const QJsonObject& payload) {
    if (status != QStringLiteral("progress")) {
        qCDebug(lcJobs) << "Unhandled download event" << status << "for" << jobId();
        return;
    }

    JobProgress p;
    p.percent = std::clamp(payload.value(QStringLiteral("progress")).toDouble() * 100.0, 0.0, 100.0);
    if (payload.contains(QStringLiteral("downloaded"))) {
        p.bytesTransferred = static_cast<quint64>(payload.value(QStringLiteral("downloaded")).toDouble());
    }
    if (payload.contains(QStringLiteral("total"))) {
        p.totalBytes = static_cast<quint64>(payload.value(QStringLiteral("total")).toDouble());
    }
    reportProgress(p);
}
