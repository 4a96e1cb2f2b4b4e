// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_APICLIENT_H
#define REMOTEFS_APICLIENT_H

#include <QByteArray>
#include <QFuture>
#include <QJsonObject>
#include <QObject>
#include <QString>
#include <optional>
#include "ApiEndpoints.h"
#include "FsTypes.h"
#include "RemoteFsError.h"

class ApiReply;
class Transport;

/**
 * Shared entry point of the services: the transport, the endpoint builder
 * and the error-message rules of the file API.
 *
 * Does not own the transport.
 */
class ApiClient final : public QObject {
    Q_OBJECT

public:
    ApiClient(Transport* transport, ApiEndpoints endpoints, QObject* parent = nullptr);

    [[nodiscard]] Transport* transport() const { return m_transport; }
    [[nodiscard]] const ApiEndpoints& endpoints() const { return m_endpoints; }

    /**
     * Asks the server to cancel a job.
     *
     * The returned future yields true when the server acknowledged the request.
     * A failed request is logged and yields false; it never throws.
     */
    QFuture<bool> cancelJob(JobKind kind, const QString& jobId);

    // Random base-36 token used for job ids.
    [[nodiscard]] static QString newToken();

    [[nodiscard]] static std::optional<QJsonObject> parseObject(const QByteArray& body, QString* errorOut = nullptr);

    // "error" or "message" field of a JSON object body, empty otherwise.
    [[nodiscard]] static QString serverMessage(const QByteArray& body);

    [[nodiscard]] static QString listingErrorMessage(const ApiReply& reply);
    [[nodiscard]] static QString mutationErrorMessage(const ApiReply& reply, const QString& verb);
    [[nodiscard]] static QString uploadErrorMessage(const ApiReply& reply);
    [[nodiscard]] static QString jobTriggerErrorMessage(const ApiReply& reply);

    // Wraps a message with the failure kind the reply represents.
    [[nodiscard]] static RemoteFsError errorFor(const ApiReply& reply, const QString& message);

private:
    Transport* m_transport = nullptr;
    ApiEndpoints m_endpoints;
};

#endif //REMOTEFS_APICLIENT_H
