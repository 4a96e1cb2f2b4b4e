// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_EXTRACTJOB_H
#define REMOTEFS_EXTRACTJOB_H

#include <QString>
#include "Job.h"

class ExtractJob final : public Job {
    Q_OBJECT

public:
    ExtractJob(ApiClient* client, const QString& archivePath, const QString& outputDirectory, QObject* parent = nullptr);

    [[nodiscard]] const QString& archivePath() const { return m_archivePath; }
    [[nodiscard]] const QString& outputDirectory() const { return m_outputDirectory; }

protected:
    ApiReply* trigger() override;
    void channelOpened() override;
    void handleEvent(const QString& status, const QJsonObject& payload) override;

private:
    QString m_archivePath;
    QString m_outputDirectory;
};

#endif //REMOTEFS_EXTRACTJOB_H
