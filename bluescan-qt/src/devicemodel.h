/**
 * @file devicemodel.h
 * @brief Qt Model for the discovered-device list
 */

#ifndef DEVICEMODEL_H
#define DEVICEMODEL_H

#include "scannerbridge.h"
#include <QAbstractListModel>
#include <QList>

class DeviceModel : public QAbstractListModel {
  Q_OBJECT

public:
  enum DeviceRoles { NameRole = Qt::UserRole + 1, AddressRole, CategoryRole };

  explicit DeviceModel(QObject *parent = nullptr);

  // QAbstractListModel interface
  int rowCount(const QModelIndex &parent = QModelIndex()) const override;
  QVariant data(const QModelIndex &index,
                int role = Qt::DisplayRole) const override;
  QHash<int, QByteArray> roleNames() const override;

  /// Append a device; an address already listed is left as it is
  void addDevice(const DeviceInfo &device);
  void clear();

  DeviceInfo deviceAt(const QModelIndex &index) const;

private:
  QList<DeviceInfo> devices_;

  int findDevice(const QString &address) const;
};

#endif // DEVICEMODEL_H
