// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_JOBCONTROLLER_H
#define REMOTEFS_JOBCONTROLLER_H

#include <QFuture>
#include <QHash>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <functional>
#include "FsTypes.h"
#include "Job.h"

class ApiClient;

// Each callback is optional. onProgress may fire many times, the others at most once per job.
struct JobCallbacks {
    std::function<void(const JobProgress&)> onProgress;
    std::function<void()> onSuccess;
    std::function<void(const QString&)> onError;
    std::function<void()> onCancelled;
};

struct JobHandle {
    QString jobId;
    JobKind kind = JobKind::Upload;
    QFuture<void> completion;
    std::function<QFuture<bool>()> cancel;
    QPointer<Job> job; // null once the job has been released
};

/**
 * Starts jobs and keeps track of the ones still running.
 *
 * Jobs are owned by the controller and released (deleteLater) once they reach
 * a terminal state; their completion futures stay valid.
 */
class JobController final : public QObject {
    Q_OBJECT

public:
    explicit JobController(ApiClient* client, QObject* parent = nullptr);

    JobHandle upload(const QString& localFile, const QString& targetDirectory, const JobCallbacks& callbacks = {});
    JobHandle archive(const QString& archiveName, const QStringList& entries, const QString& cwd, const JobCallbacks& callbacks = {});
    JobHandle extract(const QString& archivePath, const QString& outputDirectory, const JobCallbacks& callbacks = {});

    // completion resolves once the server accepted the download, not when it is done.
    JobHandle uploadFromUrl(const QString& sourceUrl, const QString& filepath, const JobCallbacks& callbacks = {});

    /**
     * Cancels a job by id.
     *
     * Works for jobs that were already released: the cancel request is still sent
     * to the server for the kind the id was started with.
     */
    QFuture<bool> cancel(const QString& jobId);

    [[nodiscard]] QStringList activeJobs() const;
    [[nodiscard]] Job* job(const QString& jobId) const;

signals:
    void jobStarted(const QString& jobId);
    void jobFinished(const QString& jobId, Job::State state);

private:
    JobHandle adopt(Job* job, const JobCallbacks& callbacks, QFuture<void> completion);

    ApiClient* m_client = nullptr;
    QHash<QString, QPointer<Job>> m_jobs;
    QHash<QString, JobKind> m_kinds; // every id ever started
};

#endif //REMOTEFS_JOBCONTROLLER_H
