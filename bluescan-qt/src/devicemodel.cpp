/**
 * @file devicemodel.cpp
 * @brief Device model implementation
 */

#include "devicemodel.h"

DeviceModel::DeviceModel(QObject *parent) : QAbstractListModel(parent) {}

int DeviceModel::rowCount(const QModelIndex &parent) const {
  if (parent.isValid())
    return 0;
  return devices_.size();
}

QVariant DeviceModel::data(const QModelIndex &index, int role) const {
  if (!index.isValid() || index.row() >= devices_.size()) {
    return QVariant();
  }

  const auto &device = devices_.at(index.row());

  switch (role) {
  case Qt::DisplayRole:
    return QString("%1\n%2 (%3)")
        .arg(device.name, device.address, device.category);
  case NameRole:
    return device.name;
  case AddressRole:
    return device.address;
  case CategoryRole:
    return device.category;
  case Qt::ToolTipRole:
    return QString("%1\nAddress: %2\nType: %3")
        .arg(device.name, device.address, device.category);
  default:
    return QVariant();
  }
}

QHash<int, QByteArray> DeviceModel::roleNames() const {
  QHash<int, QByteArray> roles;
  roles[NameRole] = "deviceName";
  roles[AddressRole] = "deviceAddress";
  roles[CategoryRole] = "deviceCategory";
  return roles;
}

void DeviceModel::addDevice(const DeviceInfo &device) {
  if (findDevice(device.address) >= 0) {
    return;
  }

  beginInsertRows(QModelIndex(), devices_.size(), devices_.size());
  devices_.append(device);
  endInsertRows();
}

void DeviceModel::clear() {
  beginResetModel();
  devices_.clear();
  endResetModel();
}

DeviceInfo DeviceModel::deviceAt(const QModelIndex &index) const {
  if (!index.isValid() || index.row() >= devices_.size()) {
    return DeviceInfo();
  }
  return devices_.at(index.row());
}

int DeviceModel::findDevice(const QString &address) const {
  for (int i = 0; i < devices_.size(); ++i) {
    if (devices_[i].address == address) {
      return i;
    }
  }
  return -1;
}
