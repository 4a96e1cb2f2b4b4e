// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QPromise>
#include <QSaveFile>
#include <memory>
#include "FileOperations.h"
#include "ApiClient.h"
#include "EntryNormalizer.h"
#include "Logging.h"
#include "Transport.h"

namespace {
    QByteArray toJson(const QJsonObject& obj) {
        return QJsonDocument(obj).toJson(QJsonDocument::Compact);
    }
}

FileOperations::FileOperations(ApiClient* client, QObject* parent)
    : QObject(parent), m_client(client) {}

QFuture<void> FileOperations::submit(ApiReply* reply, const QString& verb) {
    auto promise = std::make_shared<QPromise<void>>();
    promise->start();

    reply->setParent(this);
    connect(reply, &ApiReply::finished, this, [reply, promise, verb]() {
        reply->deleteLater();

        if (!reply->isSuccess()) {
            const QString message = ApiClient::mutationErrorMessage(*reply, verb);
            qCWarning(lcOps) << "Failed to" << verb << ":" << message;
            promise->setException(ApiClient::errorFor(*reply, message));
            promise->finish();
            return;
        }

        qCDebug(lcOps) << verb << "done";
        promise->finish();
    });

    return promise->future();
}

QFuture<void> FileOperations::copy(const QStringList& sources, const QString& destinationDirectory) {
    QJsonObject body;
    body.insert(QStringLiteral("entries"), QJsonArray::fromStringList(sources));
    body.insert(QStringLiteral("path"), destinationDirectory);

    qCInfo(lcOps) << "Copying" << sources << "to" << destinationDirectory;
    return submit(m_client->transport()->post(m_client->endpoints().copy(), toJson(body)), QStringLiteral("copy"));
}

QFuture<void> FileOperations::move(const QStringList& sources, const QString& destinationDirectory) {
    QJsonObject body;
    body.insert(QStringLiteral("entries"), QJsonArray::fromStringList(sources));
    body.insert(QStringLiteral("path"), destinationDirectory);

    qCInfo(lcOps) << "Moving" << sources << "to" << destinationDirectory;
    return submit(m_client->transport()->post(m_client->endpoints().move(), toJson(body)), QStringLiteral("move"));
}

QFuture<void> FileOperations::rename(const QString& source, const QString& destination) {
    QJsonObject body;
    body.insert(QStringLiteral("source"), EntryNormalizer::stripLeadingSeparator(source));
    body.insert(QStringLiteral("destination"), EntryNormalizer::stripLeadingSeparator(destination));

    qCInfo(lcOps) << "Renaming" << source << "to" << destination;
    return submit(m_client->transport()->post(m_client->endpoints().rename(), toJson(body)), QStringLiteral("rename"));
}

QFuture<void> FileOperations::remove(const QStringList& paths) {
    QJsonObject body;
    body.insert(QStringLiteral("paths"), QJsonArray::fromStringList(paths));

    qCInfo(lcOps) << "Deleting" << paths;
    return submit(m_client->transport()->deleteResource(m_client->endpoints().remove(), toJson(body)), QStringLiteral("delete"));
}

QFuture<void> FileOperations::createEntry(const QString& path, bool isDirectory) {
    QJsonObject body;
    body.insert(QStringLiteral("path"), EntryNormalizer::stripLeadingSeparator(path));
    body.insert(QStringLiteral("is_directory"), isDirectory);

    qCInfo(lcOps) << "Creating" << (isDirectory ? "directory" : "file") << path;
    return submit(m_client->transport()->post(m_client->endpoints().create(), toJson(body)), QStringLiteral("create"));
}

QFuture<QString> FileOperations::readContents(const QString& filepath) {
    auto promise = std::make_shared<QPromise<QString>>();
    promise->start();

    ApiReply* reply = m_client->transport()->get(m_client->endpoints().contents(filepath));
    reply->setParent(this);
    connect(reply, &ApiReply::finished, this, [reply, promise, filepath]() {
        reply->deleteLater();

        if (!reply->isSuccess()) {
            const QString message = ApiClient::mutationErrorMessage(*reply, QStringLiteral("read file"));
            qCWarning(lcOps) << "Reading" << filepath << "failed:" << message;
            promise->setException(ApiClient::errorFor(*reply, message));
            promise->finish();
            return;
        }

        promise->addResult(QString::fromUtf8(reply->body()));
        promise->finish();
    });

    return promise->future();
}

QFuture<void> FileOperations::writeContents(const QString& filepath, const QString& text) {
    qCInfo(lcOps) << "Saving" << filepath;
    return submit(m_client->transport()->post(m_client->endpoints().contents(filepath), text.toUtf8()),
                  QStringLiteral("save file"));
}

QUrl FileOperations::downloadUrl(const QStringList& items, const QString& cwd) const {
    return m_client->endpoints().download(items, cwd);
}

QFuture<void> FileOperations::download(const QStringList& items, const QString& cwd, const QString& localFile) {
    auto promise = std::make_shared<QPromise<void>>();
    promise->start();

    ApiRequest request;
    request.url = downloadUrl(items, cwd);

    qCInfo(lcOps) << "Downloading" << items << "into" << localFile;
    ApiReply* reply = m_client->transport()->get(request);
    reply->setParent(this);
    connect(reply, &ApiReply::finished, this, [reply, promise, localFile]() {
        reply->deleteLater();

        if (!reply->isSuccess()) {
            const QString message = ApiClient::mutationErrorMessage(*reply, QStringLiteral("download"));
            qCWarning(lcOps) << "Download failed:" << message;
            promise->setException(ApiClient::errorFor(*reply, message));
            promise->finish();
            return;
        }

        QSaveFile out(localFile);
        if (!out.open(QIODevice::WriteOnly) || out.write(reply->body()) != reply->body().size() || !out.commit()) {
            const QString message = QStringLiteral("Cannot write %1: %2").arg(localFile, out.errorString());
            qCWarning(lcOps) << message;
            promise->setException(RemoteFsError(RemoteFsError::Kind::Application, message));
            promise->finish();
            return;
        }

        promise->finish();
    });

    return promise->future();
}
