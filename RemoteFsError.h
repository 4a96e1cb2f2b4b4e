// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_REMOTEFSERROR_H
#define REMOTEFS_REMOTEFSERROR_H

#include <QByteArray>
#include <QException>
#include <QString>

/**
 * Failure stored into the futures returned by the client.
 *
 * Transport errors mean no usable HTTP exchange happened (network failure,
 * channel dropped). Application errors carry a non-success HTTP status or an
 * "error" notification from the server. A user cancellation is never reported
 * through this type.
 */
class RemoteFsError final : public QException {
public:
    enum class Kind : quint8 { Transport, Application };

    RemoteFsError(Kind kind, const QString& message, int httpStatus = 0)
        : m_kind(kind), m_message(message), m_utf8(message.toUtf8()), m_httpStatus(httpStatus) {}

    void raise() const override { throw *this; }
    [[nodiscard]] RemoteFsError* clone() const override { return new RemoteFsError(*this); }

    [[nodiscard]] const char* what() const noexcept override { return m_utf8.constData(); }

    [[nodiscard]] Kind kind() const { return m_kind; }
    [[nodiscard]] const QString& message() const { return m_message; }
    [[nodiscard]] int httpStatus() const { return m_httpStatus; }

private:
    Kind m_kind;
    QString m_message;
    QByteArray m_utf8;
    int m_httpStatus = 0;
};

#endif //REMOTEFS_REMOTEFSERROR_H
