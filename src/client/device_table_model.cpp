#include "device_table_model.hpp"

#include <QtGui/QColor>

namespace fl::client {

DeviceTableModel::DeviceTableModel(QObject *parent) : QAbstractTableModel(parent) {}

int DeviceTableModel::rowCount(const QModelIndex &parent) const {
    if (parent.isValid()) {
        return 0;
    }
    return rows_.size();
}

int DeviceTableModel::columnCount(const QModelIndex &parent) const {
    if (parent.isValid()) {
        return 0;
    }
    return ColumnCount;
}

QVariant DeviceTableModel::data(const QModelIndex &index, int role) const {
    if (!index.isValid() || index.row() >= rows_.size()) {
        return {};
    }

    const auto &row = rows_.at(index.row());
    if (role == Qt::DisplayRole) {
        switch (index.column()) {
            case Name:
                return row.listing.name;
            case Id:
                return row.listing.id;
            case Type:
                return row.listing.type;
            case Streaming:
                return row.streaming ? tr("yes") : tr("no");
            default:
                return {};
        }
    }
    if (role == Qt::ForegroundRole && index.column() == Streaming) {
        return row.streaming ? QColor(Qt::darkGreen) : QColor(Qt::gray);
    }
    return {};
}

QVariant DeviceTableModel::headerData(int section, Qt::Orientation orientation, int role) const {
    if (orientation == Qt::Horizontal && role == Qt::DisplayRole) {
        switch (section) {
            case Name:
                return tr("Name");
            case Id:
                return tr("Device ID");
            case Type:
                return tr("Type");
            case Streaming:
                return tr("Streaming");
            default:
                return {};
        }
    }
    return QAbstractTableModel::headerData(section, orientation, role);
}

void DeviceTableModel::setDevices(const QVector<DeviceListing> &devices) {
    beginResetModel();
    rows_.clear();
    for (const auto &listing : devices) {
        DeviceRow row;
        row.listing = listing;
        row.streaming = active_.contains(normalize_device_id(listing.id));
        rows_.push_back(row);
    }
    endResetModel();
}

void DeviceTableModel::setActive(const QSet<QString> &deviceIds) {
    active_.clear();
    for (const auto &id : deviceIds) {
        active_.insert(normalize_device_id(id));
    }
    for (int i = 0; i < rows_.size(); ++i) {
        const bool streaming = active_.contains(normalize_device_id(rows_.at(i).listing.id));
        if (rows_.at(i).streaming == streaming) {
            continue;
        }
        rows_[i].streaming = streaming;
        const QModelIndex cell = index(i, Streaming);
        emit dataChanged(cell, cell);
    }
}

QVector<DeviceListing> DeviceTableModel::devices() const {
    QVector<DeviceListing> out;
    out.reserve(rows_.size());
    for (const auto &row : rows_) {
        out.push_back(row.listing);
    }
    return out;
}

}  // namespace fl::client
