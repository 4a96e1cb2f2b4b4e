// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_URLUPLOADJOB_H
#define REMOTEFS_URLUPLOADJOB_H

#include <QFuture>
#include <QPromise>
#include <QString>
#include <memory>
#include "Job.h"

/**
 * Has the server download a URL into a file.
 *
 * The request that starts the download is the notification channel itself,
 * so there is no separate trigger. accepted() resolves as soon as the channel
 * opens; the outcome is reported through the regular job signals.
 */
class UrlUploadJob final : public Job {
    Q_OBJECT

public:
    UrlUploadJob(ApiClient* client, const QString& sourceUrl, const QString& filepath, QObject* parent = nullptr);

    // Resolves when the server accepted the job, rejects if it never did.
    [[nodiscard]] QFuture<void> accepted() const { return m_accepted->future(); }

    /**
     * There is no cancel endpoint: closing the channel stops the server-side
     * download, so the job is marked Cancelled locally.
     */
    QFuture<bool> cancel() override;

protected:
    [[nodiscard]] ApiRequest channelRequest() const override;
    ApiReply* trigger() override { return nullptr; }
    void channelOpened() override;
    void handleEvent(const QString& status, const QJsonObject& payload) override;

private:
    void settleAccepted();

    QString m_sourceUrl;
    QString m_filepath;
    std::shared_ptr<QPromise<void>> m_accepted;
};

#endif //REMOTEFS_URLUPLOADJOB_H
