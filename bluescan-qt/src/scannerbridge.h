/**
 * @file scannerbridge.h
 * @brief Bridge between Qt UI and libbluescan
 *
 * Wraps a ScanCoordinator and exposes it via Qt signals. Scan callbacks are
 * routed to the GUI thread through a UiExecutor, so every signal is
 * emitted on the thread that owns the bridge.
 */

#ifndef SCANNERBRIDGE_H
#define SCANNERBRIDGE_H

#include <QObject>
#include <QString>
#include <memory>

/**
 * @brief Device information for display in UI
 */
struct DeviceInfo {
  QString name;
  QString address;
  QString category; // "Phone", "Computer", ...
};

/**
 * @brief Bridge class connecting Qt UI to libbluescan
 */
class ScannerBridge : public QObject {
  Q_OBJECT
  Q_PROPERTY(bool isScanning READ isScanning NOTIFY scanningChanged)

public:
  explicit ScannerBridge(QObject *parent = nullptr);
  ~ScannerBridge();

  // ========================================================================
  // Properties
  // ========================================================================

  bool isScanning() const;

  /// False if no radio backend could be opened
  bool isAvailable() const;

  /// Mode preselected by the configuration file
  bool defaultLowEnergy() const;

  // ========================================================================
  // Scanning
  // ========================================================================

  Q_INVOKABLE void startScan(bool lowEnergy);

  /// Stop whichever scan is running
  Q_INVOKABLE void cancelScan();

signals:
  void scanningChanged(bool isScanning);
  void deviceFound(const DeviceInfo &device);
  void scanCompleted(int deviceCount, const QString &summary);
  void errorOccurred(const QString &title, const QString &message);

private:
  class Impl;
  std::unique_ptr<Impl> impl_;

  void initializeScanner();
  void setupCallbacks();
};

#endif // SCANNERBRIDGE_H
