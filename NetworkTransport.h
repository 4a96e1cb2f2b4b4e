// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_NETWORKTRANSPORT_H
#define REMOTEFS_NETWORKTRANSPORT_H

#include <QObject>
#include <QPointer>
#include <QString>
#include "EventStreamParser.h"
#include "Transport.h"

class QNetworkAccessManager;
class QNetworkReply;
class QNetworkRequest;

/**
 * Transport over QNetworkAccessManager.
 *
 * Notification channels are plain GET requests whose body is decoded as
 * text/event-stream for as long as the server keeps the response open.
 */
class NetworkTransport final : public QObject, public Transport {
    Q_OBJECT

public:
    explicit NetworkTransport(QObject* parent = nullptr);

    // 0 disables the timeout. Never applied to notification channels.
    void setRequestTimeout(int ms) { m_timeoutMs = ms; }
    void setUserAgent(const QString& userAgent) { m_userAgent = userAgent; }

    ApiReply* get(const ApiRequest& request) override;
    ApiReply* post(const ApiRequest& request, const QByteArray& body) override;
    ApiReply* postStream(const ApiRequest& request, QIODevice* body) override;
    ApiReply* deleteResource(const ApiRequest& request, const QByteArray& body) override;
    EventChannel* openChannel(const ApiRequest& request) override;

private:
    [[nodiscard]] QNetworkRequest toNetworkRequest(const ApiRequest& request, bool applyTimeout) const;

    QNetworkAccessManager* m_nam = nullptr;
    int m_timeoutMs = 30000;
    QString m_userAgent;
};

class NetworkApiReply final : public ApiReply {
    Q_OBJECT

public:
    explicit NetworkApiReply(QNetworkReply* reply, QObject* parent = nullptr);
    ~NetworkApiReply() override;

    [[nodiscard]] bool isFinished() const override { return m_finished; }
    [[nodiscard]] int statusCode() const override { return m_status; }
    [[nodiscard]] QString reasonPhrase() const override { return m_reason; }
    [[nodiscard]] QByteArray body() const override { return m_body; }
    [[nodiscard]] QString transportError() const override { return m_transportError; }
    [[nodiscard]] bool wasAborted() const override { return m_aborted; }

    void abort() override;

private:
    void onFinished();

    QPointer<QNetworkReply> m_reply;
    bool m_finished = false;
    bool m_aborted = false;
    int m_status = 0;
    QString m_reason;
    QByteArray m_body;
    QString m_transportError;
};

class NetworkEventChannel final : public EventChannel {
    Q_OBJECT

public:
    explicit NetworkEventChannel(QNetworkReply* reply, QObject* parent = nullptr);
    ~NetworkEventChannel() override;

    [[nodiscard]] bool isOpen() const override { return m_open && !m_closed; }
    void close() override;

private:
    void onMetaDataChanged();
    void onReadyRead();
    void onFinished();
    void fail(const QString& message);

    QPointer<QNetworkReply> m_reply;
    EventStreamParser m_parser;
    bool m_open = false;
    bool m_closed = false;
};

#endif //REMOTEFS_NETWORKTRANSPORT_H
