// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QPromise>
#include "JobController.h"
#include "ApiClient.h"
#include "ArchiveJob.h"
#include "ExtractJob.h"
#include "Logging.h"
#include "UploadJob.h"
#include "UrlUploadJob.h"

JobController::JobController(ApiClient* client, QObject* parent)
    : QObject(parent), m_client(client) {}

JobHandle JobController::upload(const QString& localFile, const QString& targetDirectory, const JobCallbacks& callbacks) {
    auto* job = new UploadJob(m_client, localFile, targetDirectory, this);
    return adopt(job, callbacks, job->completion());
}

JobHandle JobController::archive(const QString& archiveName, const QStringList& entries, const QString& cwd, const JobCallbacks& callbacks) {
    auto* job = new ArchiveJob(m_client, archiveName, entries, cwd, this);
    return adopt(job, callbacks, job->completion());
}

JobHandle JobController::extract(const QString& archivePath, const QString& outputDirectory, const JobCallbacks& callbacks) {
    auto* job = new ExtractJob(m_client, archivePath, outputDirectory, this);
    return adopt(job, callbacks, job->completion());
}

JobHandle JobController::uploadFromUrl(const QString& sourceUrl, const QString& filepath, const JobCallbacks& callbacks) {
    auto* job = new UrlUploadJob(m_client, sourceUrl, filepath, this);
    return adopt(job, callbacks, job->accepted());
}

JobHandle JobController::adopt(Job* job, const JobCallbacks& callbacks, QFuture<void> completion) {
    const QString id = job->jobId();
    m_jobs.insert(id, job);
    m_kinds.insert(id, job->kind());

    if (callbacks.onProgress) {
        connect(job, &Job::progressChanged, this, [cb = callbacks.onProgress](const JobProgress& p) { cb(p); });
    }
    if (callbacks.onSuccess) {
        connect(job, &Job::succeeded, this, [cb = callbacks.onSuccess]() { cb(); });
    }
    if (callbacks.onError) {
        connect(job, &Job::failed, this, [cb = callbacks.onError](const QString& message) { cb(message); });
    }
    if (callbacks.onCancelled) {
        connect(job, &Job::cancelled, this, [cb = callbacks.onCancelled]() { cb(); });
    }

    connect(job, &Job::finished, this, [this, job, id](Job::State state) {
        m_jobs.remove(id);
        job->deleteLater();
        Q_EMIT jobFinished(id, state);
    });

    qCDebug(lcJobs) << "Starting" << jobKindName(job->kind()) << "job" << id;
    Q_EMIT jobStarted(id);
    job->start();

    JobHandle handle;
    handle.jobId = id;
    handle.kind = job->kind();
    handle.completion = std::move(completion);
    handle.job = job;
    handle.cancel = [self = QPointer<JobController>(this), id]() -> QFuture<bool> {
        if (!self) {
            QPromise<bool> p;
            p.start();
            p.addResult(false);
            p.finish();
            return p.future();
        }
        return self->cancel(id);
    };
    return handle;
}

QFuture<bool> JobController::cancel(const QString& jobId) {
    if (Job* j = job(jobId)) {
        return j->cancel();
    }

    const auto it = m_kinds.constFind(jobId);
    if (it != m_kinds.constEnd()) {
        return m_client->cancelJob(it.value(), jobId);
    }

    qCWarning(lcJobs) << "Cancel requested for unknown job" << jobId;
    QPromise<bool> p;
    p.start();
    p.addResult(false);
    p.finish();
    return p.future();
}

QStringList JobController::activeJobs() const {
    QStringList out;
    for (auto it = m_jobs.constBegin(); it != m_jobs.constEnd(); ++it) {
        if (it.value() && !it.value()->isTerminal()) out << it.key();
    }
    out.sort();
    return out;
}

Job* JobController::job(const QString& jobId) const {
    return m_jobs.value(jobId).data();
}
