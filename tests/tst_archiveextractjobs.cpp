// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QJsonArray>
#include <QSignalSpy>
#include <QTest>
#include "ApiClient.h"
#include "ArchiveJob.h"
#include "ExtractJob.h"
#include "FakeTransport.h"
#include "JobController.h"

class TestArchiveExtractJobs : public QObject {
    Q_OBJECT

private slots:
    void init() {
        m_transport = new FakeTransport(this);
        m_client = new ApiClient(m_transport, ApiEndpoints(QUrl(QStringLiteral("http://host")), QStringLiteral("s"), false), this);
    }

    void cleanup() {
        delete m_client;
        delete m_transport;
    }

    void archiveRequestShape() {
        ArchiveJob job(m_client, QStringLiteral("mods.zip"), {QStringLiteral("/mods/a.jar"), QStringLiteral("/mods/b.jar")}, QStringLiteral("/mods"));
        QVERIFY(job.jobId().startsWith(QStringLiteral("mods.zip-")));

        QSignalSpy progress(&job, &Job::progressChanged);
        job.start();
        QCOMPARE(m_transport->log().first(), QStringLiteral("CHANNEL /api/server/s/fs/archive/status/") + job.jobId());

        m_transport->lastChannel()->open();
        QCOMPARE(progress.count(), 1);
        QCOMPARE(job.progress().percent, 0.0);

        FakeReply* post = m_transport->lastReply();
        QCOMPARE(FakeTransport::describe(post->method(), post->request().url), QStringLiteral("POST /api/server/s/fs/archive"));
        const QJsonObject body = post->requestJson();
        QCOMPARE(body.value("entries").toArray(), (QJsonArray{"mods/a.jar", "mods/b.jar"}));
        QCOMPARE(body.value("cwd").toString(), QStringLiteral("mods"));
        QCOMPARE(body.value("filename").toString(), QStringLiteral("mods.zip"));
        QCOMPARE(body.value("tracker_id").toString(), job.jobId());
    }

    void archiveCompletesOnTriggerSuccess() {
        ArchiveJob job(m_client, QStringLiteral("w.zip"), {QStringLiteral("world")}, QStringLiteral("/"));
        QSignalSpy progress(&job, &Job::progressChanged);
        QSignalSpy succeeded(&job, &Job::succeeded);
        job.start();
        FakeChannel* channel = m_transport->lastChannel();
        channel->open();

        channel->sendJson(QJsonObject{{"progress", 40}});
        QCOMPARE(job.progress().percent, 40.0);

        m_transport->lastReply()->respondJson(200, QJsonObject{{"message", "ok"}});
        QCOMPARE(job.state(), Job::State::Completed);
        QCOMPARE(succeeded.count(), 1);

        channel->sendJson(QJsonObject{{"progress", 80}});
        channel->sendJson(QJsonObject{{"status", "complete"}});
        QCOMPARE(progress.count(), 2);
        QCOMPARE(succeeded.count(), 1);
    }

    void archiveServerCancellation() {
        ArchiveJob job(m_client, QStringLiteral("w.zip"), {QStringLiteral("world")}, QStringLiteral("/"));
        QSignalSpy cancelled(&job, &Job::cancelled);
        QSignalSpy failed(&job, &Job::failed);
        job.start();
        FakeChannel* channel = m_transport->lastChannel();
        channel->open();
        FakeReply* post = m_transport->lastReply();

        channel->sendJson(QJsonObject{{"status", "cancelled"}});
        QCOMPARE(job.state(), Job::State::Cancelled);
        QCOMPARE(cancelled.count(), 1);
        QCOMPARE(failed.count(), 0);
        QVERIFY(post->wasAborted());
    }

    void archiveTriggerFailureUsesServerMessage() {
        ArchiveJob job(m_client, QStringLiteral("w.zip"), {QStringLiteral("world")}, QStringLiteral("/"));
        job.start();
        m_transport->lastChannel()->open();

        m_transport->lastReply()->respondJson(409, QJsonObject{{"error", "Archive already exists"}});
        QCOMPARE(job.state(), Job::State::Failed);
        QCOMPARE(job.errorMessage(), QStringLiteral("Archive already exists"));
        QCOMPARE(job.error()->httpStatus(), 409);
    }

    void extractRequestShape() {
        ExtractJob job(m_client, QStringLiteral("/mods.zip"), QStringLiteral("/mods"));
        job.start();
        QCOMPARE(m_transport->log().first(), QStringLiteral("CHANNEL /api/server/s/fs/extract/status/") + job.jobId());
        m_transport->lastChannel()->open();

        QCOMPARE(m_transport->log().last(),
                 QStringLiteral("POST /api/server/s/fs/extract?archive=mods.zip&directory=mods&tracker=") + job.jobId());
    }

    void extractThroughController() {
        JobController controller(m_client);

        QList<JobProgress> progress;
        int successes = 0;
        int errors = 0;
        int cancels = 0;

        JobCallbacks callbacks;
        callbacks.onProgress = [&](const JobProgress& p) { progress << p; };
        callbacks.onSuccess = [&]() { ++successes; };
        callbacks.onError = [&](const QString&) { ++errors; };
        callbacks.onCancelled = [&]() { ++cancels; };

        const JobHandle handle = controller.extract(QStringLiteral("/mods.zip"), QStringLiteral("/mods"), callbacks);
        QCOMPARE(handle.kind, JobKind::Extract);
        QCOMPARE(controller.activeJobs(), QStringList{handle.jobId});

        FakeChannel* channel = m_transport->lastChannel();
        channel->open();
        channel->sendJson(QJsonObject{{"progress", 50}, {"filesProcessed", 5}, {"totalFiles", 10}});

        QCOMPARE(progress.size(), 2);
        QCOMPARE(progress.last().percent, 50.0);
        QCOMPARE(progress.last().filesProcessed.value_or(0), quint64(5));
        QCOMPARE(progress.last().totalFiles.value_or(0), quint64(10));

        channel->sendJson(QJsonObject{{"status", "complete"}});
        QCOMPARE(successes, 1);

        channel->sendJson(QJsonObject{{"status", "extracting"}, {"progress", 90}});
        channel->sendJson(QJsonObject{{"status", "complete"}});
        QCOMPARE(progress.size(), 2);
        QCOMPARE(successes, 1);
        QCOMPARE(errors, 0);
        QCOMPARE(cancels, 0);

        QVERIFY(controller.activeJobs().isEmpty());
        QTRY_VERIFY(handle.job.isNull());
        QVERIFY(handle.completion.isFinished());
    }

    void extractingStatusIsProgress() {
        ExtractJob job(m_client, QStringLiteral("a.tar.gz"), QStringLiteral("out"));
        job.start();
        FakeChannel* channel = m_transport->lastChannel();
        channel->open();

        channel->sendJson(QJsonObject{{"status", "extracting"}, {"progress", 30}, {"filesProcessed", 3}});
        QCOMPARE(job.state(), Job::State::InProgress);
        QCOMPARE(job.progress().percent, 30.0);
        QCOMPARE(job.progress().filesProcessed.value_or(0), quint64(3));
        QVERIFY(!job.progress().totalFiles.has_value());

        channel->sendJson(QJsonObject{{"status", "extracting"}, {"progress", 20}});
        QCOMPARE(job.progress().percent, 30.0);
    }

    void failedCancelKeepsState() {
        ExtractJob job(m_client, QStringLiteral("a.zip"), QStringLiteral("out"));
        job.start();
        FakeChannel* channel = m_transport->lastChannel();
        channel->open();

        QFuture<bool> ack = job.cancel();
        FakeReply* cancel = m_transport->findReply(QStringLiteral("POST /api/server/s/fs/extract/cancel/") + job.jobId());
        QVERIFY(cancel);
        cancel->respondJson(404, QJsonObject{{"error", "No such job"}});
        QTRY_VERIFY(ack.isFinished());
        QVERIFY(!ack.result());
        QCOMPARE(job.state(), Job::State::InProgress);

        channel->sendJson(QJsonObject{{"status", "complete"}});
        QCOMPARE(job.state(), Job::State::Completed);
    }

    void cancelAfterTerminalStillAsksServer() {
        ArchiveJob job(m_client, QStringLiteral("w.zip"), {QStringLiteral("world")}, QStringLiteral("/"));
        job.start();
        FakeChannel* channel = m_transport->lastChannel();
        channel->open();
        channel->sendJson(QJsonObject{{"status", "error"}, {"message", "Out of space"}});
        QCOMPARE(job.state(), Job::State::Failed);

        job.cancel();
        QVERIFY(m_transport->logIndexOf(QStringLiteral("POST /api/server/s/fs/archive/cancel/") + job.jobId()) >= 0);
        QCOMPARE(job.state(), Job::State::Failed);
    }

    void controllerCancelsReleasedJob() {
        JobController controller(m_client);
        const JobHandle handle = controller.archive(QStringLiteral("w.zip"), {QStringLiteral("world")}, QStringLiteral("/"));
        FakeChannel* channel = m_transport->lastChannel();
        channel->open();
        m_transport->lastReply()->respond(200);
        QTRY_VERIFY(handle.job.isNull());

        QFuture<bool> ack = handle.cancel();
        FakeReply* cancel = m_transport->findReply(QStringLiteral("POST /api/server/s/fs/archive/cancel/") + handle.jobId);
        QVERIFY(cancel);
        cancel->respond(200);
        QTRY_VERIFY(ack.isFinished());
        QVERIFY(ack.result());

        QFuture<bool> unknown = controller.cancel(QStringLiteral("nope"));
        QVERIFY(unknown.isFinished());
        QVERIFY(!unknown.result());
    }

    void controllerSignals() {
        JobController controller(m_client);
        QSignalSpy started(&controller, &JobController::jobStarted);
        QSignalSpy finished(&controller, &JobController::jobFinished);

        const JobHandle a = controller.extract(QStringLiteral("a.zip"), QStringLiteral("a"));
        FakeChannel* channelA = m_transport->lastChannel();
        const JobHandle b = controller.extract(QStringLiteral("b.zip"), QStringLiteral("b"));

        QCOMPARE(started.count(), 2);
        QCOMPARE(controller.activeJobs().size(), 2);
        QCOMPARE(controller.job(a.jobId), a.job.data());

        channelA->fail(QStringLiteral("Network unreachable"));
        QCOMPARE(finished.count(), 1);
        QCOMPARE(finished.at(0).at(0).toString(), a.jobId);
        QCOMPARE(finished.at(0).at(1).value<Job::State>(), Job::State::Failed);
        QCOMPARE(controller.activeJobs(), QStringList{b.jobId});

        QTRY_VERIFY(a.completion.isFinished());
        try {
            a.completion.waitForFinished();
            QFAIL("expected a failure");
        } catch (const RemoteFsError& e) {
            QCOMPARE(e.kind(), RemoteFsError::Kind::Transport);
            QCOMPARE(e.message(), QStringLiteral("Network unreachable"));
        }
    }

private:
    FakeTransport* m_transport = nullptr;
    ApiClient* m_client = nullptr;
};

QTEST_GUILESS_MAIN(TestArchiveExtractJobs)
#include "tst_archiveextractjobs.moc"
