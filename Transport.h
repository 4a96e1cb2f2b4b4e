// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_TRANSPORT_H
#define REMOTEFS_TRANSPORT_H

#include <QByteArray>
#include <QList>
#include <QMetaType>
#include <QObject>
#include <QPair>
#include <QString>
#include <QUrl>

class QIODevice;

struct ApiRequest {
    QUrl url;
    QList<QPair<QByteArray, QByteArray>> headers;
    QByteArray contentType;
};

// One dispatched record of a notification channel.
struct ChannelEvent {
    QString name = QStringLiteral("message");
    QByteArray data;
    QString id;
};

Q_DECLARE_METATYPE(ChannelEvent)

/**
 * A single HTTP exchange. Emits finished() exactly once, including after abort().
 * Owned by whoever asked the Transport for it.
 */
class ApiReply : public QObject {
    Q_OBJECT

public:
    using QObject::QObject;

    [[nodiscard]] virtual bool isFinished() const = 0;

    // 0 when no HTTP response was received.
    [[nodiscard]] virtual int statusCode() const = 0;
    [[nodiscard]] virtual QString reasonPhrase() const = 0;
    [[nodiscard]] virtual QByteArray body() const = 0;

    // Empty when an HTTP response (of any status) was received.
    [[nodiscard]] virtual QString transportError() const = 0;
    [[nodiscard]] virtual bool wasAborted() const = 0;

    virtual void abort() = 0;

    [[nodiscard]] bool isSuccess() const {
        return transportError().isEmpty() && statusCode() >= 200 && statusCode() < 300;
    }

signals:
    void finished();
    void uploadProgress(qint64 bytesSent, qint64 bytesTotal);
};

/**
 * Server-to-client event stream for one job id.
 *
 * opened() fires at most once and always before the first eventReceived().
 * failed() reports transport trouble, not application errors. After close()
 * no signal is emitted any more.
 */
class EventChannel : public QObject {
    Q_OBJECT

public:
    using QObject::QObject;

    [[nodiscard]] virtual bool isOpen() const = 0;
    virtual void close() = 0;

signals:
    void opened();
    void eventReceived(const ChannelEvent& event);
    void failed(const QString& message);
};

class Transport {
public:
    virtual ~Transport() = default;

    virtual ApiReply* get(const ApiRequest& request) = 0;
    virtual ApiReply* post(const ApiRequest& request, const QByteArray& body) = 0;

    // body must stay alive until the reply has finished.
    virtual ApiReply* postStream(const ApiRequest& request, QIODevice* body) = 0;

    virtual ApiReply* deleteResource(const ApiRequest& request, const QByteArray& body) = 0;

    virtual EventChannel* openChannel(const ApiRequest& request) = 0;
};

#endif //REMOTEFS_TRANSPORT_H
