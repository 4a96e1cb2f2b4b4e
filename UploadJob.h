// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_UPLOADJOB_H
#define REMOTEFS_UPLOADJOB_H

#include <QPointer>
#include <QString>
#include "Job.h"

class QFile;

/**
 * Streams one local file into a remote directory.
 *
 * Progress is reported in bytes as confirmed by the server, with percent
 * derived from the local file size.
 */
class UploadJob final : public Job {
    Q_OBJECT

public:
    UploadJob(ApiClient* client, const QString& localFile, const QString& targetDirectory, QObject* parent = nullptr);

    [[nodiscard]] const QString& localFile() const { return m_localFile; }
    [[nodiscard]] const QString& targetPath() const { return m_targetPath; }
    [[nodiscard]] quint64 totalBytes() const { return m_totalBytes; }

protected:
    ApiReply* trigger() override;
    [[nodiscard]] QString triggerErrorMessage(const ApiReply& reply) const override;
    void handleEvent(const QString& status, const QJsonObject& payload) override;

private:
    QString m_localFile;
    QString m_targetPath;
    quint64 m_totalBytes = 0;
    QPointer<QFile> m_body;
};

#endif //REMOTEFS_UPLOADJOB_H
