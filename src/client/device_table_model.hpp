#pragma once

#include <QtCore/QAbstractTableModel>
#include <QtCore/QSet>
#include <QtCore/QVector>

#include "device_directory.hpp"

namespace fl::client {

struct DeviceRow {
    DeviceListing listing;
    bool streaming = false;
};

class DeviceTableModel : public QAbstractTableModel {
    Q_OBJECT

public:
    enum Column {
        Name = 0,
        Id,
        Type,
        Streaming,
        ColumnCount
    };

    explicit DeviceTableModel(QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent) const override;
    int columnCount(const QModelIndex &parent) const override;
    QVariant data(const QModelIndex &index, int role) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role) const override;

    void setDevices(const QVector<DeviceListing> &devices);
    void setActive(const QSet<QString> &deviceIds);

    QVector<DeviceListing> devices() const;

private:
    QVector<DeviceRow> rows_;
    QSet<QString> active_;  // normalized ids
};

}  // namespace fl::client
