// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QSignalSpy>
#include <QTest>
#include "ApiClient.h"
#include "FakeTransport.h"
#include "JobController.h"
#include "UrlUploadJob.h"

class TestUrlUploadJob : public QObject {
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

    void channelIsTheRequest() {
        UrlUploadJob job(m_client, QStringLiteral("https://cdn.example/x.jar"), QStringLiteral("/mods/x.jar"));
        job.start();

        QCOMPARE(m_transport->log(),
                 QStringList{QStringLiteral("CHANNEL /api/server/s/fs/upload-url?url=https://cdn.example/x.jar&filepath=/mods/x.jar")});
        QVERIFY(!job.accepted().isFinished());

        m_transport->lastChannel()->open();
        QCOMPARE(job.state(), Job::State::InProgress);
        QVERIFY(job.accepted().isFinished());
        QCOMPARE(m_transport->replies().size(), 0);
    }

    void namedEventsDriveTheJob() {
        UrlUploadJob job(m_client, QStringLiteral("https://cdn.example/x.jar"), QStringLiteral("/x.jar"));
        QSignalSpy succeeded(&job, &Job::succeeded);
        job.start();
        FakeChannel* channel = m_transport->lastChannel();
        channel->open();

        channel->sendJson(QJsonObject{{"progress", 0.5}, {"downloaded", 512}, {"total", 1024}}, QStringLiteral("progress"));
        QCOMPARE(job.progress().percent, 50.0);
        QCOMPARE(job.progress().bytesTransferred.value_or(0), quint64(512));
        QCOMPARE(job.progress().totalBytes.value_or(0), quint64(1024));

        channel->sendJson(QJsonObject{{"message", "Saved"}}, QStringLiteral("complete"));
        QCOMPARE(job.state(), Job::State::Completed);
        QCOMPARE(succeeded.count(), 1);
        QVERIFY(channel->isClosed());
    }

    void errorEventFails() {
        UrlUploadJob job(m_client, QStringLiteral("https://cdn.example/missing"), QStringLiteral("/m"));
        job.start();
        FakeChannel* channel = m_transport->lastChannel();
        channel->open();

        channel->sendJson(QJsonObject{{"message", "Remote returned 404"}}, QStringLiteral("error"));
        QCOMPARE(job.state(), Job::State::Failed);
        QCOMPARE(job.errorMessage(), QStringLiteral("Remote returned 404"));
    }

    void rejectedBeforeAcceptance() {
        UrlUploadJob job(m_client, QStringLiteral("ftp://nope"), QStringLiteral("/m"));
        job.start();
        m_transport->lastChannel()->fail(QStringLiteral("Error transferring: server replied: Bad Request"));

        QCOMPARE(job.state(), Job::State::Failed);
        QTRY_VERIFY(job.accepted().isFinished());
        try {
            job.accepted().waitForFinished();
            QFAIL("expected a failure");
        } catch (const RemoteFsError& e) {
            QCOMPARE(e.kind(), RemoteFsError::Kind::Transport);
        }
    }

    void cancelClosesLocally() {
        UrlUploadJob job(m_client, QStringLiteral("https://cdn.example/x.jar"), QStringLiteral("/x.jar"));
        QSignalSpy cancelled(&job, &Job::cancelled);
        job.start();
        FakeChannel* channel = m_transport->lastChannel();
        channel->open();

        QFuture<bool> first = job.cancel();
        QVERIFY(first.isFinished());
        QVERIFY(first.result());
        QCOMPARE(job.state(), Job::State::Cancelled);
        QCOMPARE(cancelled.count(), 1);
        QVERIFY(channel->isClosed());
        QCOMPARE(m_transport->replies().size(), 0);

        QFuture<bool> second = job.cancel();
        QVERIFY(!second.result());
        QCOMPARE(cancelled.count(), 1);
    }

    void controllerResolvesOnAcceptance() {
        JobController controller(m_client);
        int successes = 0;
        JobCallbacks callbacks;
        callbacks.onSuccess = [&]() { ++successes; };

        const JobHandle handle = controller.uploadFromUrl(QStringLiteral("https://cdn.example/x.jar"), QStringLiteral("/x.jar"), callbacks);
        QCOMPARE(handle.kind, JobKind::UrlUpload);
        FakeChannel* channel = m_transport->lastChannel();
        channel->open();

        QVERIFY(handle.completion.isFinished());
        QCOMPARE(successes, 0);
        QCOMPARE(controller.activeJobs().size(), 1);

        channel->sendJson(QJsonObject{{"status", "complete"}});
        QCOMPARE(successes, 1);
        QVERIFY(controller.activeJobs().isEmpty());
    }

private:
    FakeTransport* m_transport = nullptr;
    ApiClient* m_client = nullptr;
};

QTEST_GUILESS_MAIN(TestUrlUploadJob)
#include "tst_urluploadjob.moc"
