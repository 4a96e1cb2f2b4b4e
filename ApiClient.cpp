// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QJsonDocument>
#include <QJsonParseError>
#include <QPromise>
#include <QRandomGenerator>
#include <memory>
#include "ApiClient.h"
#include "Logging.h"
#include "Transport.h"

ApiClient::ApiClient(Transport* transport, ApiEndpoints endpoints, QObject* parent)
    : QObject(parent), m_transport(transport), m_endpoints(std::move(endpoints)) {}

QFuture<bool> ApiClient::cancelJob(JobKind kind, const QString& jobId) {
    auto promise = std::make_shared<QPromise<bool>>();
    promise->start();
    QFuture<bool> future = promise->future();

    const auto request = m_endpoints.cancel(kind, jobId);
    if (!request) {
        qCWarning(lcJobs) << "No cancel endpoint for" << jobKindName(kind) << "job" << jobId;
        promise->addResult(false);
        promise->finish();
        return future;
    }

    qCInfo(lcJobs) << "Requesting cancel of" << jobKindName(kind) << "job" << jobId;

    ApiReply* reply = m_transport->post(*request, QByteArray());
    connect(reply, &ApiReply::finished, this, [reply, promise, kind, jobId]() {
        reply->deleteLater();

        if (!reply->isSuccess()) {
            // The job keeps its state; it may still complete or fail on its own.
            QString message = serverMessage(reply->body());
            if (message.isEmpty()) {
                message = reply->transportError().isEmpty()
                    ? QStringLiteral("%1 - %2").arg(reply->statusCode()).arg(reply->reasonPhrase())
                    : reply->transportError();
            }
            qCWarning(lcJobs) << "Cancel of" << jobKindName(kind) << "job" << jobId << "failed:" << message;
            promise->addResult(false);
            promise->finish();
            return;
        }

        qCDebug(lcJobs) << "Cancel of" << jobKindName(kind) << "job" << jobId << "acknowledged";
        promise->addResult(true);
        promise->finish();
    });

    return future;
}

QString ApiClient::newToken() {
    // Two draws give roughly 20 base-36 digits.
    auto* rng = QRandomGenerator::global();
    return QString::number(rng->generate64() >> 11, 36) + QString::number(rng->generate(), 36);
}

std::optional<QJsonObject> ApiClient::parseObject(const QByteArray& body, QString* errorOut) {
    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorOut) *errorOut = parseError.errorString();
        return std::nullopt;
    }
    if (!doc.isObject()) {
        if (errorOut) *errorOut = QStringLiteral("Expected a JSON object");
        return std::nullopt;
    }
    return doc.object();
}

QString ApiClient::serverMessage(const QByteArray& body) {
    const auto obj = parseObject(body);
    if (!obj) return {};

    const QString error = obj->value(QStringLiteral("error")).toString();
    if (!error.isEmpty()) return error;
    return obj->value(QStringLiteral("message")).toString();
}

QString ApiClient::listingErrorMessage(const ApiReply& reply) {
    if (!reply.transportError().isEmpty()) return reply.transportError();

    const QString text = QString::fromUtf8(reply.body()).trimmed();
    if (!text.isEmpty()) return text;
    return QStringLiteral("Error: %1 - %2").arg(reply.statusCode()).arg(reply.reasonPhrase());
}

QString ApiClient::mutationErrorMessage(const ApiReply& reply, const QString& verb) {
    if (!reply.transportError().isEmpty()) {
        return QStringLiteral("Failed to %1: %2").arg(verb, reply.transportError());
    }

    const QString message = serverMessage(reply.body());
    if (!message.isEmpty()) return message;
    return QStringLiteral("Failed to %1: %2").arg(verb, reply.reasonPhrase());
}

QString ApiClient::uploadErrorMessage(const ApiReply& reply) {
    if (!reply.transportError().isEmpty()) {
        return QStringLiteral("Upload failed: %1").arg(reply.transportError());
    }
    return QStringLiteral("Upload failed: %1 - %2").arg(reply.statusCode()).arg(reply.reasonPhrase());
}

QString ApiClient::jobTriggerErrorMessage(const ApiReply& reply) {
    if (!reply.transportError().isEmpty()) return reply.transportError();

    const QString message = serverMessage(reply.body());
    if (!message.isEmpty()) return message;

    const QString text = QString::fromUtf8(reply.body()).trimmed();
    if (!text.isEmpty()) return text;
    return QStringLiteral("%1 - %2").arg(reply.statusCode()).arg(reply.reasonPhrase());
}

RemoteFsError ApiClient::errorFor(const ApiReply& reply, const QString& message) {
    if (!reply.transportError().isEmpty()) {
        return RemoteFsError(RemoteFsError::Kind::Transport, message);
    }
    return RemoteFsError(RemoteFsError::Kind::Application, message, reply.statusCode());
}
