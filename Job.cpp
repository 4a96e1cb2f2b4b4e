// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "Job.h"
#include "ApiClient.h"
#include "Logging.h"

namespace {
    // Archive frames carry only {progress}; URL-upload frames use named events.
    QString logicalStatus(const ChannelEvent& event, const QJsonObject& payload) {
        const QString status = payload.value(QStringLiteral("status")).toString();
        if (!status.isEmpty()) {
            if (status == QStringLiteral("extracting")) return QStringLiteral("progress");
            return status;
        }
        if (!event.name.isEmpty() && event.name != QStringLiteral("message")) {
            return event.name;
        }
        return QStringLiteral("progress");
    }
}

Job::Job(ApiClient* client, JobKind kind, QString jobId, QObject* parent)
    : QObject(parent)
    , m_client(client)
    , m_kind(kind)
    , m_jobId(std::move(jobId))
    , m_completion(std::make_shared<QPromise<void>>()) {
    m_completion->start();
}

Job::~Job() {
    closeChannel();
}

bool Job::isTerminal() const {
    return m_state == State::Completed || m_state == State::Failed || m_state == State::Cancelled;
}

void Job::start() {
    if (m_started) return;
    m_started = true;

    const ApiRequest request = channelRequest();
    qCDebug(lcJobs) << "Subscribing" << jobKindName(m_kind) << "job" << m_jobId << "at" << request.url;

    EventChannel* channel = m_client->transport()->openChannel(request);
    channel->setParent(this);
    m_channel = channel;

    connect(channel, &EventChannel::opened, this, &Job::onChannelOpened);
    connect(channel, &EventChannel::eventReceived, this, &Job::onChannelEvent);
    connect(channel, &EventChannel::failed, this, &Job::onChannelFailed);
}

QFuture<bool> Job::cancel() {
    if (m_state == State::Pending && m_started && !isTerminal()) {
        // The server does not know the id before the trigger; send it afterwards.
        if (!m_pendingCancel) {
            m_pendingCancel = std::make_shared<QPromise<bool>>();
            m_pendingCancel->start();
        }
        return m_pendingCancel->future();
    }
    return m_client->cancelJob(m_kind, m_jobId);
}

ApiRequest Job::channelRequest() const {
    return m_client->endpoints().channel(m_kind, m_jobId);
}

QString Job::triggerErrorMessage(const ApiReply& reply) const {
    return ApiClient::jobTriggerErrorMessage(reply);
}

void Job::onChannelOpened() {
    if (m_state != State::Pending) return;

    m_state = State::InProgress;
    qCDebug(lcJobs) << jobKindName(m_kind) << "job" << m_jobId << "channel open, triggering";

    channelOpened();
    if (isTerminal()) return;

    ApiReply* reply = trigger();
    if (reply) {
        reply->setParent(this);
        m_triggerReply = reply;
        connect(reply, &ApiReply::finished, this, &Job::onTriggerFinished);
        if (reply->isFinished()) {
            QMetaObject::invokeMethod(this, &Job::onTriggerFinished, Qt::QueuedConnection);
        }
    }

    sendPendingCancel();
}

void Job::onTriggerFinished() {
    ApiReply* reply = m_triggerReply;
    if (!reply) return;
    m_triggerReply = nullptr;
    reply->deleteLater();

    if (isTerminal()) return;

    if (!reply->isSuccess()) {
        markFailed(ApiClient::errorFor(*reply, triggerErrorMessage(*reply)));
        return;
    }

    if (completesOnTriggerSuccess()) {
        markCompleted();
    }
}

void Job::onChannelEvent(const ChannelEvent& event) {
    if (isTerminal()) {
        qCDebug(lcJobs) << "Dropping event for finished" << jobKindName(m_kind) << "job" << m_jobId;
        return;
    }

    QString parseError;
    const auto payload = ApiClient::parseObject(event.data, &parseError);
    if (!payload) {
        qCWarning(lcJobs) << "Ignoring malformed notification for" << m_jobId << ":" << parseError;
        return;
    }

    const QString status = logicalStatus(event, *payload);

    if (status == QStringLiteral("complete")) {
        markCompleted();
    } else if (status == QStringLiteral("cancelled")) {
        markCancelled();
    } else if (status == QStringLiteral("error")) {
        QString message = payload->value(QStringLiteral("message")).toString();
        if (message.isEmpty()) message = payload->value(QStringLiteral("error")).toString();
        if (message.isEmpty()) message = QStringLiteral("Unknown error");
        markFailed(RemoteFsError(RemoteFsError::Kind::Application, message));
    } else {
        handleEvent(status, *payload);
    }
}

void Job::onChannelFailed(const QString& message) {
    if (isTerminal()) return;
    markFailed(RemoteFsError(RemoteFsError::Kind::Transport,
                             message.isEmpty() ? QStringLiteral("Connection closed unexpectedly") : message));
}

void Job::reportProgress(const JobProgress& progress) {
    if (isTerminal()) return;

    if (m_hasProgress) {
        const bool regressive = (progress.bytesTransferred && m_progress.bytesTransferred)
            ? *progress.bytesTransferred < *m_progress.bytesTransferred
            : progress.percent < m_progress.percent;
        if (regressive) {
            qCDebug(lcJobs) << "Dropping regressive progress for" << m_jobId;
            return;
        }
    }

    m_progress = progress;
    m_hasProgress = true;
    Q_EMIT progressChanged(m_progress);
}

bool Job::enterTerminal(State state) {
    if (isTerminal()) {
        qCDebug(lcJobs) << "Ignoring second terminal event for" << m_jobId << "(already" << m_state << ")";
        return false;
    }

    m_state = state;
    closeChannel();

    if (m_triggerReply && !m_triggerReply->isFinished()) {
        m_triggerReply->abort();
    }

    sendPendingCancel();
    return true;
}

void Job::markCompleted() {
    if (!enterTerminal(State::Completed)) return;

    qCInfo(lcJobs) << jobKindName(m_kind) << "job" << m_jobId << "completed";
    Q_EMIT succeeded();
    Q_EMIT finished(m_state);
    m_completion->finish();
}

void Job::markFailed(const RemoteFsError& error) {
    if (!enterTerminal(State::Failed)) return;

    m_errorMessage = error.message();
    m_error = error;
    qCWarning(lcJobs) << jobKindName(m_kind) << "job" << m_jobId << "failed:" << m_errorMessage;
    Q_EMIT failed(m_errorMessage);
    Q_EMIT finished(m_state);
    m_completion->setException(error);
    m_completion->finish();
}

void Job::markCancelled() {
    if (!enterTerminal(State::Cancelled)) return;

    qCInfo(lcJobs) << jobKindName(m_kind) << "job" << m_jobId << "cancelled";
    Q_EMIT cancelled();
    Q_EMIT finished(m_state);
    m_completion->finish();
}

void Job::closeChannel() {
    if (!m_channel) return;

    EventChannel* channel = m_channel;
    m_channel = nullptr;
    channel->close();
    channel->disconnect(this);
    channel->deleteLater();
}

void Job::sendPendingCancel() {
    auto pending = std::move(m_pendingCancel);
    if (!pending) return;

    m_client->cancelJob(m_kind, m_jobId).then(this, [pending](bool acknowledged) {
        pending->addResult(acknowledged);
        pending->finish();
    });
}
