// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_FILELISTINGSERVICE_H
#define REMOTEFS_FILELISTINGSERVICE_H

#include <QFuture>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QString>
#include <optional>
#include "FsTypes.h"

class ApiClient;
class ApiReply;

/**
 * Directory listing and search for one logical view.
 *
 * At most one listing and one search are in flight per service. A new call
 * aborts the one it supersedes before anything caller-visible changes; the
 * superseded call yields a cancelled future and never reaches the
 * listingChanged / searchResultsChanged signals.
 */
class FileListingService final : public QObject {
    Q_OBJECT

public:
    explicit FileListingService(ApiClient* client, QObject* parent = nullptr);

    /**
     * Fetches a directory.
     *
     * On failure notify() is emitted and the future rejects with RemoteFsError.
     */
    QFuture<Listing> list(const QString& path);

    QFuture<QList<Entry>> search(const QString& query, bool filenameOnly);

    // Aborts the in-flight search, if any.
    void cancelSearch();

    // Resolves one entry through its parent directory. Empty when absent or on lookup failure.
    QFuture<std::optional<Entry>> entryInfo(const QString& path);

    QFuture<bool> pathExists(const QString& path);

    [[nodiscard]] const Listing& currentListing() const { return m_listing; }
    [[nodiscard]] const QList<Entry>& searchResults() const { return m_searchResults; }
    [[nodiscard]] const QString& searchQuery() const { return m_searchQuery; }

signals:
    void listingChanged(const Listing& listing);
    void searchResultsChanged(const QList<Entry>& results, const QString& query);

    // User-facing failure report.
    void notify(const QString& title, const QString& message);

private:
    // Listing without supersession or state changes.
    QFuture<Listing> fetch(const QString& path);

    static std::optional<Listing> decodeListing(const ApiReply& reply, const QString& requestedPath, QString* errorOut);
    static std::optional<QList<Entry>> decodeSearch(const ApiReply& reply, QString* errorOut);

    ApiClient* m_client = nullptr;

    Listing m_listing;
    QList<Entry> m_searchResults;
    QString m_searchQuery;

    QPointer<ApiReply> m_listReply;
    QPointer<ApiReply> m_searchReply;

    quint64 m_listSerial = 0;   // drops stale listing replies
    quint64 m_searchSerial = 0; // drops stale search replies
};

#endif //REMOTEFS_FILELISTINGSERVICE_H
