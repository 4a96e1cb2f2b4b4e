// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QPromise>
#include <memory>
#include "FileListingService.h"
#include "ApiClient.h"
#include "EntryNormalizer.h"
#include "Logging.h"
#include "Transport.h"

namespace {
    template <typename T>
    void settleCancelled(QPromise<T>& promise) {
        promise.future().cancel();
        promise.finish();
    }
}

FileListingService::FileListingService(ApiClient* client, QObject* parent)
    : QObject(parent), m_client(client) {}

std::optional<Listing> FileListingService::decodeListing(const ApiReply& reply, const QString& requestedPath, QString* errorOut) {
    if (!reply.isSuccess()) {
        if (errorOut) *errorOut = ApiClient::listingErrorMessage(reply);
        return std::nullopt;
    }

    QString parseError;
    const auto obj = ApiClient::parseObject(reply.body(), &parseError);
    if (!obj) {
        if (errorOut) *errorOut = QStringLiteral("Invalid directory listing: %1").arg(parseError);
        return std::nullopt;
    }

    auto listing = EntryNormalizer::normalizeListing(*obj, errorOut);
    if (listing && listing->currentPath.isEmpty()) {
        listing->currentPath = requestedPath;
    }
    return listing;
}

std::optional<QList<Entry>> FileListingService::decodeSearch(const ApiReply& reply, QString* errorOut) {
    if (!reply.isSuccess()) {
        if (errorOut) *errorOut = ApiClient::mutationErrorMessage(reply, QStringLiteral("search"));
        return std::nullopt;
    }

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(reply.body(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        if (errorOut) *errorOut = QStringLiteral("Invalid search response");
        return std::nullopt;
    }

    QList<Entry> out;
    const QJsonArray hits = doc.array();
    out.reserve(hits.size());
    for (const QJsonValue& v : hits) {
        QString hitError;
        auto entry = EntryNormalizer::normalizeSearchHit(v.toObject(), &hitError);
        if (!entry) {
            qCDebug(lcListing) << "Skipping search hit:" << hitError;
            continue;
        }
        out.push_back(*entry);
    }
    return out;
}

QFuture<Listing> FileListingService::list(const QString& path) {
    if (m_listReply) {
        qCDebug(lcListing) << "Superseding listing request";
        m_listReply->abort();
    }

    const quint64 serial = ++m_listSerial;
    auto promise = std::make_shared<QPromise<Listing>>();
    promise->start();

    qCDebug(lcListing) << "Listing" << path;
    ApiReply* reply = m_client->transport()->get(m_client->endpoints().listDirectory(path));
    reply->setParent(this);
    m_listReply = reply;

    connect(reply, &ApiReply::finished, this, [this, reply, promise, serial, path]() {
        reply->deleteLater();
        if (m_listReply == reply) m_listReply = nullptr;

        // Drop stale replies (a newer listing was requested while this one was in flight)
        if (reply->wasAborted() || serial != m_listSerial) {
            qCDebug(lcListing) << "Dropping superseded listing of" << path;
            settleCancelled(*promise);
            return;
        }

        QString err;
        auto listing = decodeListing(*reply, path, &err);
        if (!listing) {
            qCWarning(lcListing) << "Listing" << path << "failed:" << err;
            Q_EMIT notify(QStringLiteral("Failed to load directory"), err);
            promise->setException(ApiClient::errorFor(*reply, err));
            promise->finish();
            return;
        }

        m_listing = *listing;
        Q_EMIT listingChanged(m_listing);

        promise->addResult(m_listing);
        promise->finish();
    });

    return promise->future();
}

QFuture<Listing> FileListingService::fetch(const QString& path) {
    auto promise = std::make_shared<QPromise<Listing>>();
    promise->start();

    ApiReply* reply = m_client->transport()->get(m_client->endpoints().listDirectory(path));
    reply->setParent(this);

    connect(reply, &ApiReply::finished, this, [reply, promise, path]() {
        reply->deleteLater();

        QString err;
        auto listing = decodeListing(*reply, path, &err);
        if (!listing) {
            promise->setException(ApiClient::errorFor(*reply, err));
            promise->finish();
            return;
        }
        promise->addResult(*listing);
        promise->finish();
    });

    return promise->future();
}

void FileListingService::cancelSearch() {
    if (!m_searchReply) return;
    qCDebug(lcListing) << "Aborting search for" << m_searchQuery;
    ++m_searchSerial;
    m_searchReply->abort();
}

QFuture<QList<Entry>> FileListingService::search(const QString& query, bool filenameOnly) {
    // The previous search must be gone before the new one is issued.
    cancelSearch();

    const quint64 serial = ++m_searchSerial;
    m_searchQuery = query;

    auto promise = std::make_shared<QPromise<QList<Entry>>>();
    promise->start();

    qCDebug(lcListing) << "Searching" << query << (filenameOnly ? "(filenames)" : "(contents)");
    ApiReply* reply = m_client->transport()->get(m_client->endpoints().search(query, filenameOnly));
    reply->setParent(this);
    m_searchReply = reply;

    connect(reply, &ApiReply::finished, this, [this, reply, promise, serial, query]() {
        reply->deleteLater();
        if (m_searchReply == reply) m_searchReply = nullptr;

        if (reply->wasAborted() || serial != m_searchSerial) {
            qCDebug(lcListing) << "Dropping superseded search for" << query;
            settleCancelled(*promise);
            return;
        }

        QString err;
        auto results = decodeSearch(*reply, &err);
        if (!results) {
            qCWarning(lcListing) << "Search for" << query << "failed:" << err;
            promise->setException(ApiClient::errorFor(*reply, err));
            promise->finish();
            return;
        }

        m_searchResults = *results;
        Q_EMIT searchResultsChanged(m_searchResults, query);

        promise->addResult(m_searchResults);
        promise->finish();
    });

    return promise->future();
}

QFuture<std::optional<Entry>> FileListingService::entryInfo(const QString& path) {
    const QString normalized = EntryNormalizer::normalizePath(path);
    const qsizetype slash = normalized.lastIndexOf(u'/');
    const QString parent = slash <= 0 ? QStringLiteral("/") : normalized.left(slash);
    const QString name = normalized.mid(slash + 1);

    return fetch(parent).then(this, [name, path](QFuture<Listing> f) -> std::optional<Entry> {
        try {
            const Listing listing = f.result();
            for (const Entry& e : listing.entries) {
                if (e.name == name) return e;
            }
            return std::nullopt;
        } catch (const RemoteFsError& e) {
            qCWarning(lcListing) << "Lookup of" << path << "failed:" << e.message();
            return std::nullopt;
        }
    });
}

QFuture<bool> FileListingService::pathExists(const QString& path) {
    return fetch(path).then(this, [path](QFuture<Listing> f) -> bool {
        try {
            f.waitForFinished();
            return true;
        } catch (const RemoteFsError& e) {
            qCDebug(lcListing) << path << "is not listable:" << e.message();
            return false;
        }
    });
}
