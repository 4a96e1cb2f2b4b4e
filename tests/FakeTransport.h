// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_FAKETRANSPORT_H
#define REMOTEFS_FAKETRANSPORT_H

#include <QJsonObject>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QStringList>
#include "Transport.h"

class FakeTransport;

class FakeReply final : public ApiReply {
    Q_OBJECT

public:
    FakeReply(FakeTransport* owner, QString method, ApiRequest request, QByteArray requestBody);

    [[nodiscard]] bool isFinished() const override { return m_finished; }
    [[nodiscard]] int statusCode() const override { return m_status; }
    [[nodiscard]] QString reasonPhrase() const override { return m_reason; }
    [[nodiscard]] QByteArray body() const override { return m_body; }
    [[nodiscard]] QString transportError() const override { return m_transportError; }
    [[nodiscard]] bool wasAborted() const override { return m_aborted; }
    void abort() override;

    void respond(int status, const QByteArray& body = {}, const QString& reason = {});
    void respondJson(int status, const QJsonObject& body);
    void failTransport(const QString& message);

    [[nodiscard]] const QString& method() const { return m_method; }
    [[nodiscard]] const ApiRequest& request() const { return m_request; }
    [[nodiscard]] const QByteArray& requestBody() const { return m_requestBody; }
    [[nodiscard]] QJsonObject requestJson() const;

private:
    QPointer<FakeTransport> m_owner;
    QString m_method;
    ApiRequest m_request;
    QByteArray m_requestBody;

    bool m_finished = false;
    bool m_aborted = false;
    int m_status = 0;
    QString m_reason;
    QByteArray m_body;
    QString m_transportError;
};

class FakeChannel final : public EventChannel {
    Q_OBJECT

public:
    FakeChannel(FakeTransport* owner, ApiRequest request);

    [[nodiscard]] bool isOpen() const override { return m_open && !m_closed; }
    void close() override;

    void open();
    void send(const QByteArray& data, const QString& name = QStringLiteral("message"));
    void sendJson(const QJsonObject& payload, const QString& name = QStringLiteral("message"));
    void fail(const QString& message = QStringLiteral("Connection closed unexpectedly"));

    [[nodiscard]] bool isClosed() const { return m_closed; }
    [[nodiscard]] const ApiRequest& request() const { return m_request; }

private:
    QPointer<FakeTransport> m_owner;
    ApiRequest m_request;
    bool m_open = false;
    bool m_closed = false;
};

/**
 * Scripted Transport: every call is appended to log() in issue order as
 * "METHOD path?query"; channels additionally log "OPEN path" when a test
 * opens them, so ordering between subscribe and trigger can be asserted.
 */
class FakeTransport final : public QObject, public Transport {
    Q_OBJECT

public:
    using QObject::QObject;

    ApiReply* get(const ApiRequest& request) override;
    ApiReply* post(const ApiRequest& request, const QByteArray& body) override;
    ApiReply* postStream(const ApiRequest& request, QIODevice* body) override;
    ApiReply* deleteResource(const ApiRequest& request, const QByteArray& body) override;
    EventChannel* openChannel(const ApiRequest& request) override;

    [[nodiscard]] const QStringList& log() const { return m_log; }
    [[nodiscard]] qsizetype logIndexOf(const QString& prefix) const;

    [[nodiscard]] QList<FakeReply*> replies() const;
    [[nodiscard]] QList<FakeChannel*> channels() const;
    [[nodiscard]] FakeReply* lastReply() const;
    [[nodiscard]] FakeChannel* lastChannel() const;

    // First live reply whose "METHOD path" starts with prefix.
    [[nodiscard]] FakeReply* findReply(const QString& prefix) const;

    [[nodiscard]] static QString describe(const QString& method, const QUrl& url);

    void record(const QString& line) { m_log << line; }

private:
    FakeReply* make(const QString& method, const ApiRequest& request, const QByteArray& body);

    QStringList m_log;
    QList<QPointer<FakeReply>> m_replies;
    QList<QPointer<FakeChannel>> m_channels;
};

#endif //REMOTEFS_FAKETRANSPORT_H
