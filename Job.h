// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_JOB_H
#define REMOTEFS_JOB_H

#include <QFuture>
#include <QJsonObject>
#include <QObject>
#include <QPointer>
#include <QPromise>
#include <QString>
#include <memory>
#include <optional>
#include "FsTypes.h"
#include "RemoteFsError.h"
#include "Transport.h"

class ApiClient;

/**
 * One server-tracked operation correlated by a client-generated id.
 *
 * A job runs in two phases. start() subscribes to the notification channel
 * for jobId(); only when that channel reports open does trigger() send the
 * request that makes the server begin work. Events that arrive afterwards
 * drive the state machine:
 *
 *   Pending -> InProgress -> Completed | Failed | Cancelled
 *
 * Terminal states are final: the first terminal event wins, the channel is
 * closed and every later event is dropped. Job::cancel() never enters
 * Cancelled itself; that state comes from a server notification.
 */
class Job : public QObject {
    Q_OBJECT

public:
    enum class State : quint8 { Pending, InProgress, Completed, Failed, Cancelled };
    Q_ENUM(State)

    ~Job() override;

    [[nodiscard]] const QString& jobId() const { return m_jobId; }
    [[nodiscard]] JobKind kind() const { return m_kind; }
    [[nodiscard]] State state() const { return m_state; }
    [[nodiscard]] bool isTerminal() const;
    [[nodiscard]] const JobProgress& progress() const { return m_progress; }
    [[nodiscard]] const QString& errorMessage() const { return m_errorMessage; }
    [[nodiscard]] const std::optional<RemoteFsError>& error() const { return m_error; }

    /**
     * Resolves on Completed and on Cancelled, rejects with RemoteFsError on Failed.
     */
    [[nodiscard]] QFuture<void> completion() const { return m_completion->future(); }

    // Subscribes to the notification channel. Calling it twice is a no-op.
    void start();

    /**
     * Asks the server to cancel this job.
     *
     * The request is always sent, even when the job already reached a terminal
     * state. A cancel issued before the channel opened is sent right after the
     * triggering request. The future yields whether the server acknowledged it.
     */
    virtual QFuture<bool> cancel();

signals:
    void progressChanged(const JobProgress& progress);
    void succeeded();
    void failed(const QString& message);
    void cancelled();
    void finished(Job::State state);

protected:
    Job(ApiClient* client, JobKind kind, QString jobId, QObject* parent = nullptr);

    [[nodiscard]] ApiClient* client() const { return m_client; }

    virtual ApiRequest channelRequest() const;

    // Sends the triggering request. nullptr when the channel itself is the request.
    virtual ApiReply* trigger() = 0;

    [[nodiscard]] virtual QString triggerErrorMessage(const ApiReply& reply) const;

    // Whether a successful triggering response finishes the job by itself.
    [[nodiscard]] virtual bool completesOnTriggerSuccess() const { return false; }

    // Runs after the channel opened, before trigger().
    virtual void channelOpened() {}

    /**
     * @param status Logical status: progress, complete, cancelled, error or a kind-specific name.
     * @param payload The decoded JSON object of the event.
     */
    virtual void handleEvent(const QString& status, const QJsonObject& payload) = 0;

    // Drops values that would make progress go backwards.
    void reportProgress(const JobProgress& progress);

    void markCompleted();
    void markFailed(const RemoteFsError& error);
    void markCancelled();

    void closeChannel();

private:
    void onChannelOpened();
    void onChannelEvent(const ChannelEvent& event);
    void onChannelFailed(const QString& message);
    void onTriggerFinished();

    bool enterTerminal(State state);
    void sendPendingCancel();

    ApiClient* m_client = nullptr;
    JobKind m_kind;
    QString m_jobId;

    State m_state = State::Pending;
    JobProgress m_progress;
    bool m_hasProgress = false;
    QString m_errorMessage;
    std::optional<RemoteFsError> m_error;

    bool m_started = false;
    QPointer<EventChannel> m_channel;
    QPointer<ApiReply> m_triggerReply;

    std::shared_ptr<QPromise<void>> m_completion;
    std::shared_ptr<QPromise<bool>> m_pendingCancel; // cancel() before trigger
};

#endif //REMOTEFS_JOB_H
