// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>
#include <QFile>
#include <QFileInfo>
#include "UploadJob.h"
#include "ApiClient.h"
#include "EntryNormalizer.h"
#include "Logging.h"

UploadJob::UploadJob(ApiClient* client, const QString& localFile, const QString& targetDirectory, QObject* parent)
    : Job(client, JobKind::Upload, ApiClient::newToken(), parent)
    , m_localFile(localFile)
    , m_targetPath(EntryNormalizer::joinPath(targetDirectory, QFileInfo(localFile).fileName())) {
    const QFileInfo info(localFile);
    m_totalBytes = info.exists() ? static_cast<quint64>(info.size()) : 0;
}

ApiReply* UploadJob::trigger() {
    auto* file = new QFile(m_localFile, this);
    if (!file->open(QIODevice::ReadOnly)) {
        const QString message = QStringLiteral("Cannot read %1: %2").arg(m_localFile, file->errorString());
        file->deleteLater();
        markFailed(RemoteFsError(RemoteFsError::Kind::Application, message));
        return nullptr;
    }
    m_body = file;
    m_totalBytes = static_cast<quint64>(file->size());

    qCInfo(lcJobs) << "Uploading" << m_localFile << "to" << m_targetPath << "as" << jobId();
    ApiReply* reply = client()->transport()->postStream(client()->endpoints().upload(m_targetPath, jobId()), file);

    // The body must outlive the request.
    connect(reply, &ApiReply::finished, file, &QObject::deleteLater);
    return reply;
}

QString UploadJob::triggerErrorMessage(const ApiReply& reply) const {
    return ApiClient::uploadErrorMessage(reply);
}

void UploadJob::handleEvent(const QString& status, const QJsonObject& payload) {
    if (status != QStringLiteral("progress")) {
        qCDebug(lcJobs) << "Unhandled upload event" << status << "for" << jobId();
        return;
    }

    const auto bytes = static_cast<quint64>(payload.value(QStringLiteral("bytesUploaded")).toDouble());

    JobProgress p;
    p.bytesTransferred = bytes;
    p.totalBytes = m_totalBytes;
    p.percent = m_totalBytes > 0 ? std::min(100.0, 100.0 * static_cast<double>(bytes) / static_cast<double>(m_totalBytes)) : 0.0;
    reportProgress(p);
}
