// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_ARCHIVEJOB_H
#define REMOTEFS_ARCHIVEJOB_H

#include <QString>
#include <QStringList>
#include "Job.h"

// Packs a set of entries of one directory into an archive next to them.
class ArchiveJob final : public Job {
    Q_OBJECT

public:
    ArchiveJob(ApiClient* client, const QString& archiveName, const QStringList& entries, const QString& cwd, QObject* parent = nullptr);

    [[nodiscard]] const QString& archiveName() const { return m_archiveName; }

protected:
    ApiReply* trigger() override;
    [[nodiscard]] bool completesOnTriggerSuccess() const override { return true; }
    void channelOpened() override;
    void handleEvent(const QString& status, const QJsonObject& payload) override;

private:
    QString m_archiveName;
    QStringList m_entries;
    QString m_cwd;
};

#endif //REMOTEFS_ARCHIVEJOB_H
