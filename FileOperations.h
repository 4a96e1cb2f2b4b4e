// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_FILEOPERATIONS_H
#define REMOTEFS_FILEOPERATIONS_H

#include <QFuture>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QUrl>

class ApiClient;
class ApiReply;

/**
 * Plain request/response operations on remote entries.
 *
 * Every future rejects with RemoteFsError carrying the server's "error"
 * message when it sent one. Nothing is retried.
 */
class FileOperations final : public QObject {
    Q_OBJECT

public:
    explicit FileOperations(ApiClient* client, QObject* parent = nullptr);

    QFuture<void> copy(const QStringList& sources, const QString& destinationDirectory);
    QFuture<void> move(const QStringList& sources, const QString& destinationDirectory);
    QFuture<void> rename(const QString& source, const QString& destination);
    QFuture<void> remove(const QStringList& paths);
    QFuture<void> createEntry(const QString& path, bool isDirectory);

    QFuture<QString> readContents(const QString& filepath);
    QFuture<void> writeContents(const QString& filepath, const QString& text);

    // Where a browser would navigate to download items of cwd (a zip when several).
    [[nodiscard]] QUrl downloadUrl(const QStringList& items, const QString& cwd) const;

    // Fetches downloadUrl() into localFile, replacing it only on success.
    QFuture<void> download(const QStringList& items, const QString& cwd, const QString& localFile);

private:
    QFuture<void> submit(ApiReply* reply, const QString& verb);

    ApiClient* m_client = nullptr;
};

#endif //REMOTEFS_FILEOPERATIONS_H
