/**
 * @file mainwindow.h
 * @brief Main application window
 */

#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include "scannerbridge.h"
#include <QMainWindow>
#include <memory>

QT_BEGIN_NAMESPACE
namespace Ui {
class MainWindow;
}
QT_END_NAMESPACE

class DeviceModel;

class MainWindow : public QMainWindow {
  Q_OBJECT

public:
  explicit MainWindow(QWidget *parent = nullptr);
  ~MainWindow();

protected:
  void closeEvent(QCloseEvent *event) override;

private slots:
  // UI Actions
  void onScanButtonClicked();
  void onAboutClicked();

  // Bridge signals
  void onScanningChanged(bool scanning);
  void onDeviceFound(const DeviceInfo &device);
  void onScanCompleted(int deviceCount, const QString &summary);
  void onErrorOccurred(const QString &title, const QString &message);

private:
  std::unique_ptr<Ui::MainWindow> ui;
  std::unique_ptr<ScannerBridge> bridge_;
  std::unique_ptr<DeviceModel> deviceModel_;

  void setupUi();
  void setupConnections();
};

#endif // MAINWINDOW_H
