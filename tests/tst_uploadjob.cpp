// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>
#include "ApiClient.h"
#include "FakeTransport.h"
#include "UploadJob.h"

class TestUploadJob : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        qRegisterMetaType<JobProgress>();
        QVERIFY(m_dir.isValid());
        m_file = m_dir.filePath(QStringLiteral("data.bin"));
        QFile f(m_file);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write(QByteArray(1000, 'x'));
    }

    void init() {
        m_transport = new FakeTransport(this);
        m_client = new ApiClient(m_transport, ApiEndpoints(QUrl(QStringLiteral("http://host")), QStringLiteral("s"), false), this);
    }

    void cleanup() {
        delete m_client;
        delete m_transport;
    }

    void subscribesBeforeUploading() {
        UploadJob job(m_client, m_file, QStringLiteral("/plugins"));
        QCOMPARE(job.targetPath(), QStringLiteral("/plugins/data.bin"));
        QCOMPARE(job.state(), Job::State::Pending);

        job.start();
        FakeChannel* channel = m_transport->lastChannel();
        QVERIFY(channel);
        QCOMPARE(m_transport->log().size(), 1);
        QCOMPARE(m_transport->log().first(), QStringLiteral("CHANNEL /api/server/s/fs/upload/progress/") + job.jobId());
        QVERIFY(!m_transport->lastReply());

        channel->open();
        QCOMPARE(job.state(), Job::State::InProgress);

        const QString post = QStringLiteral("POST /api/server/s/fs/upload?path=/plugins/data.bin&upload_id=") + job.jobId();
        QVERIFY(m_transport->logIndexOf(post) >= 0);
        QVERIFY(m_transport->logIndexOf(QStringLiteral("OPEN ")) < m_transport->logIndexOf(post));
        QCOMPARE(m_transport->lastReply()->requestBody(), QByteArray(1000, 'x'));
    }

    void progressThenComplete() {
        UploadJob job(m_client, m_file, QStringLiteral("/"));
        QSignalSpy progress(&job, &Job::progressChanged);
        QSignalSpy succeeded(&job, &Job::succeeded);
        job.start();
        FakeChannel* channel = m_transport->lastChannel();
        channel->open();

        // The upload response alone does not finish the job.
        m_transport->lastReply()->respond(200);
        QTest::qWait(0);
        QCOMPARE(job.state(), Job::State::InProgress);

        channel->sendJson(QJsonObject{{"status", "progress"}, {"bytesUploaded", 250}});
        QCOMPARE(progress.count(), 1);
        QCOMPARE(job.progress().bytesTransferred.value_or(0), quint64(250));
        QCOMPARE(job.progress().totalBytes.value_or(0), quint64(1000));
        QCOMPARE(job.progress().percent, 25.0);

        channel->sendJson(QJsonObject{{"status", "progress"}, {"bytesUploaded", 100}});
        QCOMPARE(progress.count(), 1);
        QCOMPARE(job.progress().bytesTransferred.value_or(0), quint64(250));

        channel->sendJson(QJsonObject{{"status", "progress"}, {"bytesUploaded", 1000}});
        QCOMPARE(progress.count(), 2);

        channel->sendJson(QJsonObject{{"status", "complete"}});
        QCOMPARE(job.state(), Job::State::Completed);
        QCOMPARE(succeeded.count(), 1);
        QVERIFY(channel->isClosed());
        QTRY_VERIFY(job.completion().isFinished());
        QVERIFY(!job.completion().isCanceled());
    }

    void cancelIsServerConfirmed() {
        UploadJob job(m_client, m_file, QStringLiteral("/"));
        QSignalSpy progress(&job, &Job::progressChanged);
        QSignalSpy cancelled(&job, &Job::cancelled);
        QSignalSpy failed(&job, &Job::failed);
        job.start();
        FakeChannel* channel = m_transport->lastChannel();
        channel->open();
        channel->sendJson(QJsonObject{{"status", "progress"}, {"bytesUploaded", 10}});

        QFuture<bool> ack = job.cancel();
        FakeReply* cancelReply = m_transport->findReply(QStringLiteral("POST /api/server/s/fs/upload/cancel/") + job.jobId());
        QVERIFY(cancelReply);
        cancelReply->respond(200);
        QTRY_VERIFY(ack.isFinished());
        QVERIFY(ack.result());

        // Acknowledged, but not cancelled until the server says so.
        QCOMPARE(job.state(), Job::State::InProgress);
        QCOMPARE(cancelled.count(), 0);

        channel->sendJson(QJsonObject{{"status", "cancelled"}});
        QCOMPARE(job.state(), Job::State::Cancelled);
        QCOMPARE(cancelled.count(), 1);
        QCOMPARE(failed.count(), 0);

        channel->sendJson(QJsonObject{{"status", "progress"}, {"bytesUploaded", 500}});
        channel->sendJson(QJsonObject{{"status", "complete"}});
        QCOMPARE(progress.count(), 1);
        QCOMPARE(job.state(), Job::State::Cancelled);

        QTRY_VERIFY(job.completion().isFinished());
        job.completion().waitForFinished(); // resolves, does not throw
    }

    void errorEventRejects() {
        UploadJob job(m_client, m_file, QStringLiteral("/"));
        QSignalSpy failed(&job, &Job::failed);
        job.start();
        FakeChannel* channel = m_transport->lastChannel();
        channel->open();

        channel->sendJson(QJsonObject{{"status", "error"}, {"message", "Disk quota exceeded"}});
        QCOMPARE(job.state(), Job::State::Failed);
        QCOMPARE(failed.count(), 1);
        QCOMPARE(failed.at(0).at(0).toString(), QStringLiteral("Disk quota exceeded"));
        QVERIFY(channel->isClosed());

        // A late terminal event does not override the first.
        channel->sendJson(QJsonObject{{"status", "complete"}});
        QCOMPARE(job.state(), Job::State::Failed);

        QTRY_VERIFY(job.completion().isFinished());
        try {
            job.completion().waitForFinished();
            QFAIL("expected a failure");
        } catch (const RemoteFsError& e) {
            QCOMPARE(e.kind(), RemoteFsError::Kind::Application);
            QCOMPARE(e.message(), QStringLiteral("Disk quota exceeded"));
        }
    }

    void triggerFailureRejectsWithStatus() {
        UploadJob job(m_client, m_file, QStringLiteral("/"));
        job.start();
        FakeChannel* channel = m_transport->lastChannel();
        channel->open();

        m_transport->lastReply()->respond(500, QByteArray(), QStringLiteral("Internal Server Error"));
        QCOMPARE(job.state(), Job::State::Failed);
        QCOMPARE(job.errorMessage(), QStringLiteral("Upload failed: 500 - Internal Server Error"));
        QVERIFY(job.error().has_value());
        QCOMPARE(job.error()->httpStatus(), 500);
        QVERIFY(channel->isClosed());
    }

    void channelFailureRejects() {
        UploadJob job(m_client, m_file, QStringLiteral("/"));
        job.start();
        FakeChannel* channel = m_transport->lastChannel();
        channel->open();
        FakeReply* upload = m_transport->lastReply();

        channel->fail();
        QCOMPARE(job.state(), Job::State::Failed);
        QCOMPARE(job.errorMessage(), QStringLiteral("Connection closed unexpectedly"));
        QCOMPARE(job.error()->kind(), RemoteFsError::Kind::Transport);
        QVERIFY(upload->wasAborted());
    }

    void malformedPayloadIsIgnored() {
        UploadJob job(m_client, m_file, QStringLiteral("/"));
        job.start();
        FakeChannel* channel = m_transport->lastChannel();
        channel->open();

        channel->send("not json");
        QCOMPARE(job.state(), Job::State::InProgress);
        channel->sendJson(QJsonObject{{"status", "complete"}});
        QCOMPARE(job.state(), Job::State::Completed);
    }

    void missingLocalFileFails() {
        UploadJob job(m_client, m_dir.filePath(QStringLiteral("absent.bin")), QStringLiteral("/"));
        job.start();
        m_transport->lastChannel()->open();

        QCOMPARE(job.state(), Job::State::Failed);
        QVERIFY(job.errorMessage().startsWith(QStringLiteral("Cannot read")));
        QCOMPARE(m_transport->logIndexOf(QStringLiteral("POST")), qsizetype(-1));
    }

    void cancelBeforeOpenIsSentAfterTrigger() {
        UploadJob job(m_client, m_file, QStringLiteral("/"));
        job.start();
        QFuture<bool> ack = job.cancel();
        QCOMPARE(m_transport->logIndexOf(QStringLiteral("POST")), qsizetype(-1));

        m_transport->lastChannel()->open();
        const qsizetype upload = m_transport->logIndexOf(QStringLiteral("POST /api/server/s/fs/upload?"));
        const qsizetype cancel = m_transport->logIndexOf(QStringLiteral("POST /api/server/s/fs/upload/cancel/"));
        QVERIFY(upload >= 0);
        QVERIFY(cancel > upload);

        m_transport->findReply(QStringLiteral("POST /api/server/s/fs/upload/cancel/"))->respond(200);
        QTRY_VERIFY(ack.isFinished());
        QVERIFY(ack.result());
    }

private:
    QTemporaryDir m_dir;
    QString m_file;
    FakeTransport* m_transport = nullptr;
    ApiClient* m_client = nullptr;
};

QTEST_GUILESS_MAIN(TestUploadJob)
#include "tst_uploadjob.moc"
