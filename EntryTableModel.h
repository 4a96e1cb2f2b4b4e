// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_ENTRYTABLEMODEL_H
#define REMOTEFS_ENTRYTABLEMODEL_H

#include <QAbstractTableModel>
#include <QList>
#include <QString>
#include <optional>
#include "FsTypes.h"

class FileListingService;

/**
 * Read-only table of the entries one view currently shows.
 *
 * Follows either the listing or the search results of a FileListingService.
 * Rows only change through the service's signals, which never carry the
 * result of a superseded request.
 */
class EntryTableModel final : public QAbstractTableModel {
    Q_OBJECT

public:
    enum class Source : quint8 { Listing, SearchResults };

    enum Column { NameColumn = 0, TypeColumn, SizeColumn, ModifiedColumn, ColumnCount };

    // Sort key of a cell: name, type label, byte size, or ms timestamp.
    static constexpr int SortRole = Qt::UserRole + 1;

    EntryTableModel(FileListingService* service, Source source, QObject* parent = nullptr);

    [[nodiscard]] std::optional<Entry> entryAtRow(int row) const;
    [[nodiscard]] const QString& currentPath() const { return m_currentPath; }

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    int columnCount(const QModelIndex& parent = QModelIndex()) const override;

    QVariant headerData(int section, Qt::Orientation orientation, int role = Qt::DisplayRole) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;

    void sort(int column, Qt::SortOrder order = Qt::AscendingOrder) override;

private:
    void setEntries(const QList<Entry>& entries);
    void applySort();

    QList<Entry> m_rows;
    QString m_currentPath;

    int m_sortColumn = NameColumn;
    Qt::SortOrder m_sortOrder = Qt::AscendingOrder;
};

#endif //REMOTEFS_ENTRYTABLEMODEL_H
