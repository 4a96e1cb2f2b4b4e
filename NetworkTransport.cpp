// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QIODevice>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include "NetworkTransport.h"
#include "Logging.h"

NetworkTransport::NetworkTransport(QObject* parent)
    : QObject(parent)
    , m_nam(new QNetworkAccessManager(this)) {}

QNetworkRequest NetworkTransport::toNetworkRequest(const ApiRequest& request, bool applyTimeout) const {
    QNetworkRequest req(request.url);

    for (const auto& [name, value] : request.headers) {
        req.setRawHeader(name, value);
    }
    if (!request.contentType.isEmpty()) {
        req.setHeader(QNetworkRequest::ContentTypeHeader, request.contentType);
    }
    if (!m_userAgent.isEmpty()) {
        req.setHeader(QNetworkRequest::UserAgentHeader, m_userAgent);
    }
    if (applyTimeout && m_timeoutMs > 0) {
        req.setTransferTimeout(m_timeoutMs);
    }
    return req;
}

ApiReply* NetworkTransport::get(const ApiRequest& request) {
    qCDebug(lcTransport) << "GET" << request.url.toString();
    return new NetworkApiReply(m_nam->get(toNetworkRequest(request, true)));
}

ApiReply* NetworkTransport::post(const ApiRequest& request, const QByteArray& body) {
    qCDebug(lcTransport) << "POST" << request.url.toString() << body.size() << "bytes";
    return new NetworkApiReply(m_nam->post(toNetworkRequest(request, true), body));
}

ApiReply* NetworkTransport::postStream(const ApiRequest& request, QIODevice* body) {
    // Streamed bodies can take arbitrarily long; the server reports progress instead.
    QNetworkRequest req = toNetworkRequest(request, false);
    req.setAttribute(QNetworkRequest::DoNotBufferUploadDataAttribute, true);
    if (body && !body->isSequential()) {
        req.setHeader(QNetworkRequest::ContentLengthHeader, body->size());
    }
    if (request.contentType.isEmpty()) {
        req.setHeader(QNetworkRequest::ContentTypeHeader, QByteArrayLiteral("application/octet-stream"));
    }

    qCDebug(lcTransport) << "POST (streamed)" << request.url.toString();
    return new NetworkApiReply(m_nam->post(req, body));
}

ApiReply* NetworkTransport::deleteResource(const ApiRequest& request, const QByteArray& body) {
    qCDebug(lcTransport) << "DELETE" << request.url.toString();
    return new NetworkApiReply(m_nam->sendCustomRequest(toNetworkRequest(request, true), "DELETE", body));
}

EventChannel* NetworkTransport::openChannel(const ApiRequest& request) {
    QNetworkRequest req = toNetworkRequest(request, false);
    req.setRawHeader("Accept", "text/event-stream");
    req.setRawHeader("Cache-Control", "no-cache");
    req.setAttribute(QNetworkRequest::CacheLoadControlAttribute, QNetworkRequest::AlwaysNetwork);

    qCDebug(lcTransport) << "Opening notification channel" << request.url.toString();
    return new NetworkEventChannel(m_nam->get(req));
}

// ---------------------------------------------------------------------------

NetworkApiReply::NetworkApiReply(QNetworkReply* reply, QObject* parent)
    : ApiReply(parent), m_reply(reply) {
    connect(reply, &QNetworkReply::finished, this, &NetworkApiReply::onFinished);
    connect(reply, &QNetworkReply::uploadProgress, this, &ApiReply::uploadProgress);
}

NetworkApiReply::~NetworkApiReply() {
    if (m_reply) {
        disconnect(m_reply, nullptr, this, nullptr);
        if (!m_finished) m_reply->abort();
        m_reply->deleteLater();
    }
}

void NetworkApiReply::abort() {
    if (m_finished) return;
    m_aborted = true;
    if (m_reply) m_reply->abort(); // emits finished -> onFinished()
}

void NetworkApiReply::onFinished() {
    if (m_finished || !m_reply) return;
    m_finished = true;

    const QVariant status = m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    m_status = status.isValid() ? status.toInt() : 0;
    m_reason = m_reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString();
    m_body = m_reply->readAll();

    // HTTP error statuses are application errors, reported through statusCode().
    if (m_status == 0) {
        if (m_reply->error() == QNetworkReply::OperationCanceledError && !m_aborted) {
            // Qt cancels the request itself when the transfer timeout expires.
            m_transportError = QStringLiteral("Request timed out");
        } else if (m_reply->error() != QNetworkReply::NoError) {
            m_transportError = m_reply->errorString();
        } else {
            m_transportError = QStringLiteral("No HTTP response received");
        }
    }

    if (!m_transportError.isEmpty() && !m_aborted) {
        qCWarning(lcTransport).noquote() << "Request to" << m_reply->url().toString() << "failed:" << m_transportError;
    }

    m_reply->deleteLater();
    m_reply = nullptr;

    Q_EMIT finished();
}

// ---------------------------------------------------------------------------

NetworkEventChannel::NetworkEventChannel(QNetworkReply* reply, QObject* parent)
    : EventChannel(parent), m_reply(reply) {
    connect(reply, &QNetworkReply::metaDataChanged, this, &NetworkEventChannel::onMetaDataChanged);
    connect(reply, &QIODevice::readyRead, this, &NetworkEventChannel::onReadyRead);
    connect(reply, &QNetworkReply::finished, this, &NetworkEventChannel::onFinished);
}

NetworkEventChannel::~NetworkEventChannel() {
    close();
}

void NetworkEventChannel::close() {
    if (m_closed) return;
    m_closed = true;

    if (m_reply) {
        disconnect(m_reply, nullptr, this, nullptr);
        m_reply->abort();
        m_reply->deleteLater();
        m_reply = nullptr;
    }
}

void NetworkEventChannel::onMetaDataChanged() {
    if (m_closed || m_open || !m_reply) return;

    const QVariant statusAttr = m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!statusAttr.isValid()) return;

    const int status = statusAttr.toInt();
    if (status >= 200 && status < 300) {
        m_open = true;
        qCDebug(lcTransport) << "Notification channel open" << m_reply->url().toString();
        Q_EMIT opened();
        return;
    }

    const QString reason = m_reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString();
    const QString message = QStringLiteral("Notification channel rejected: %1 - %2").arg(status).arg(reason);
    qCWarning(lcTransport).noquote() << message << m_reply->url().toString();
    fail(message);
}

void NetworkEventChannel::onReadyRead() {
    if (m_closed || !m_reply) return;
    if (!m_open) onMetaDataChanged();
    if (m_closed || !m_reply) return;

    const QList<ChannelEvent> events = m_parser.feed(m_reply->readAll());

    // A handler may close (and schedule deletion of) this channel mid-batch.
    QPointer<NetworkEventChannel> self(this);
    for (const ChannelEvent& ev : events) {
        if (!self || m_closed) return;
        Q_EMIT eventReceived(ev);
    }
}

void NetworkEventChannel::onFinished() {
    if (m_closed || !m_reply) return;

    if (!m_open) onMetaDataChanged();
    if (m_closed || !m_reply) return;

    onReadyRead();
    if (m_closed || !m_reply) return;

    const QString message = (m_reply->error() != QNetworkReply::NoError
                             && m_reply->error() != QNetworkReply::RemoteHostClosedError)
        ? m_reply->errorString()
        : QStringLiteral("Connection closed unexpectedly");

    qCWarning(lcTransport).noquote() << "Notification channel" << m_reply->url().toString() << "ended:" << message;
    fail(message);
}

void NetworkEventChannel::fail(const QString& message) {
    // The receiver usually closes the channel itself; whatever it does, nothing follows failed().
    QPointer<NetworkEventChannel> self(this);
    Q_EMIT failed(message);
    if (self) close();
}
