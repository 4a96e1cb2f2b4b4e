// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>
#include <limits>
#include "EntryTableModel.h"
#include "FileListingService.h"
#include "FormatUtils.h"

EntryTableModel::EntryTableModel(FileListingService* service, Source source, QObject* parent)
    : QAbstractTableModel(parent) {
    if (source == Source::Listing) {
        connect(service, &FileListingService::listingChanged, this, [this](const Listing& listing) {
            m_currentPath = listing.currentPath;
            setEntries(listing.entries);
        });
    } else {
        connect(service, &FileListingService::searchResultsChanged, this, [this](const QList<Entry>& results) {
            setEntries(results);
        });
    }
}

std::optional<Entry> EntryTableModel::entryAtRow(int row) const {
    if (row < 0 || row >= m_rows.size()) return std::nullopt;
    return m_rows[row];
}

int EntryTableModel::rowCount(const QModelIndex& parent) const {
    if (parent.isValid()) return 0;

    // QAbstractItemView expects int; clamp for safety.
    return static_cast<int>(std::min<qsizetype>(m_rows.size(), std::numeric_limits<int>::max()));
}

int EntryTableModel::columnCount(const QModelIndex& parent) const {
    if (parent.isValid()) return 0;
    return ColumnCount;
}

QVariant EntryTableModel::headerData(int section, Qt::Orientation orientation, int role) const {
    if (role != Qt::DisplayRole || orientation != Qt::Horizontal) return {};
    switch (section) {
        case NameColumn: return QStringLiteral("Name");
        case TypeColumn: return QStringLiteral("Type");
        case SizeColumn: return QStringLiteral("Size");
        case ModifiedColumn: return QStringLiteral("Date Modified");
        default: return {};
    }
}

QVariant EntryTableModel::data(const QModelIndex& index, int role) const {
    if (!index.isValid() || index.row() >= m_rows.size()) return {};
    const Entry& e = m_rows[index.row()];

    if (role == Qt::DisplayRole) {
        switch (index.column()) {
            case NameColumn: return e.name;
            case TypeColumn: return e.typeLabel;
            case SizeColumn: return e.isDirectory ? QString() : FormatUtils::formatSize(e.size);
            case ModifiedColumn: return QString::fromStdString(FormatUtils::formatTimestamp(e.modifiedAt));
            default: return {};
        }
    }

    if (role == SortRole) {
        switch (index.column()) {
            case NameColumn: return e.name;
            case TypeColumn: return e.typeLabel;
            case SizeColumn: return QVariant::fromValue<quint64>(e.size);
            case ModifiedColumn: return QVariant::fromValue<qint64>(e.modifiedAt.value_or(0));
            default: return {};
        }
    }

    if (role == Qt::ToolTipRole) {
        return e.path;
    }

    if (role == Qt::TextAlignmentRole && index.column() == SizeColumn) {
        return int(Qt::AlignRight | Qt::AlignVCenter);
    }

    return {};
}

void EntryTableModel::sort(int column, Qt::SortOrder order) {
    if (column < 0 || column >= ColumnCount) return;

    m_sortColumn = column;
    m_sortOrder = order;

    Q_EMIT layoutAboutToBeChanged();
    applySort();
    Q_EMIT layoutChanged();
}

void EntryTableModel::setEntries(const QList<Entry>& entries) {
    beginResetModel();
    m_rows = entries;
    applySort();
    endResetModel();
}

void EntryTableModel::applySort() {
    const int column = m_sortColumn;
    const bool descending = (m_sortOrder == Qt::DescendingOrder);

    // Folders stay on top regardless of direction.
    std::stable_sort(m_rows.begin(), m_rows.end(), [column, descending](const Entry& a, const Entry& b) {
        if (a.isDirectory != b.isDirectory) return a.isDirectory;

        int cmp = 0;
        switch (column) {
            case TypeColumn:
                cmp = QString::compare(a.typeLabel, b.typeLabel, Qt::CaseInsensitive);
                break;
            case SizeColumn:
                cmp = (a.size < b.size) ? -1 : (a.size > b.size ? 1 : 0);
                break;
            case ModifiedColumn: {
                const qint64 ma = a.modifiedAt.value_or(0);
                const qint64 mb = b.modifiedAt.value_or(0);
                cmp = (ma < mb) ? -1 : (ma > mb ? 1 : 0);
                break;
            }
            default:
                break;
        }
        if (cmp == 0) cmp = QString::compare(a.name, b.name, Qt::CaseInsensitive);
        return descending ? cmp > 0 : cmp < 0;
    });
}
