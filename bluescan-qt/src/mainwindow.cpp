/**
 * @file mainwindow.cpp
 * @brief Main window implementation
 */

#include "mainwindow.h"
#include "devicemodel.h"
#include "ui_mainwindow.h"

#include <QCloseEvent>
#include <QLoggingCategory>
#include <QMessageBox>

Q_LOGGING_CATEGORY(lcUi, "bluescan.ui")

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent), ui(std::make_unique<Ui::MainWindow>()),
      bridge_(std::make_unique<ScannerBridge>()),
      deviceModel_(std::make_unique<DeviceModel>()) {

  ui->setupUi(this);
  setupUi();
  setupConnections();
}

MainWindow::~MainWindow() = default;

// ============================================================================
// Setup
// ============================================================================

void MainWindow::setupUi() {
  setWindowTitle("BlueScan");
  setMinimumSize(360, 520);

  ui->deviceListView->setModel(deviceModel_.get());
  ui->bleCheckBox->setChecked(bridge_->defaultLowEnergy());
  onScanningChanged(false);

  if (!bridge_->isAvailable()) {
    ui->scanButton->setEnabled(false);
    ui->statusBar->showMessage("Bluetooth unavailable");
  }
}

void MainWindow::setupConnections() {
  connect(ui->scanButton, &QPushButton::clicked, this,
          &MainWindow::onScanButtonClicked);

  connect(ui->actionAbout, &QAction::triggered, this,
          &MainWindow::onAboutClicked);

  connect(ui->actionQuit, &QAction::triggered, this, &QWidget::close);

  // Bridge signals
  connect(bridge_.get(), &ScannerBridge::scanningChanged, this,
          &MainWindow::onScanningChanged);

  connect(bridge_.get(), &ScannerBridge::deviceFound, this,
          &MainWindow::onDeviceFound);

  connect(bridge_.get(), &ScannerBridge::scanCompleted, this,
          &MainWindow::onScanCompleted);

  connect(bridge_.get(), &ScannerBridge::errorOccurred, this,
          &MainWindow::onErrorOccurred);
}

// ============================================================================
// UI Actions
// ============================================================================

void MainWindow::onScanButtonClicked() {
  if (bridge_->isScanning()) {
    qCInfo(lcUi) << "Cancel scan";
    bridge_->cancelScan();
    return;
  }

  deviceModel_->clear();
  bool lowEnergy = ui->bleCheckBox->isChecked();
  ui->statusBar->showMessage(lowEnergy ? "Scanning for BLE devices..."
                                       : "Scanning for devices...");
  bridge_->startScan(lowEnergy);
}

void MainWindow::onAboutClicked() {
  QMessageBox::about(this, "About BlueScan",
                     "<h2>BlueScan</h2>"
                     "<p>Version 1.0.0</p>"
                     "<p>Lists nearby Bluetooth Classic and Bluetooth Low "
                     "Energy devices.</p>");
}

// ============================================================================
// Bridge Signal Handlers
// ============================================================================

void MainWindow::onScanningChanged(bool scanning) {
  ui->scanButton->setText(scanning ? "Stop Scanning" : "Scan Now");
  // The mode cannot change under a running scan
  ui->bleCheckBox->setEnabled(!scanning);
}

void MainWindow::onDeviceFound(const DeviceInfo &device) {
  deviceModel_->addDevice(device);
  ui->statusBar->showMessage(QString("Found: %1").arg(device.name), 3000);
}

void MainWindow::onScanCompleted(int deviceCount, const QString &summary) {
  qCInfo(lcUi) << "Scan complete," << deviceCount << "device(s)";
  ui->statusBar->showMessage(summary);
}

void MainWindow::onErrorOccurred(const QString &title, const QString &message) {
  ui->statusBar->showMessage(title);
  QMessageBox::warning(this, title, message);
}

void MainWindow::closeEvent(QCloseEvent *event) {
  bridge_->cancelScan();
  event->accept();
}
