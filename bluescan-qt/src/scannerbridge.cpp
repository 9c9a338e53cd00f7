/**
 * @file scannerbridge.cpp
 * @brief BlueScan Bridge Implementation
 */

#include "scannerbridge.h"
#include "uiexecutor.h"
#include <QLoggingCategory>
#include <bluescan/bluescan.h>

Q_LOGGING_CATEGORY(lcBridge, "bluescan.bridge")

namespace {

QString toQString(const std::string &s) { return QString::fromStdString(s); }

QString errorTitle(bluescan::ErrorCode code) {
  switch (code) {
  case bluescan::ErrorCode::PermissionDenied:
    return "Permission Required";
  case bluescan::ErrorCode::RadioUnavailable:
    return "No Bluetooth Adapter";
  case bluescan::ErrorCode::RadioDisabled:
    return "Bluetooth Is Off";
  case bluescan::ErrorCode::ServiceUnavailable:
    return "Bluetooth Service Unavailable";
  default:
    return "Scan Error";
  }
}

QString errorText(const bluescan::Error &error) {
  QString text = toQString(error.message);
  if (!error.details.empty()) {
    text += QString(" (%1)").arg(toQString(error.details));
  }
  return text;
}

} // namespace

// ============================================================================
// ScannerBridge Implementation
// ============================================================================

class ScannerBridge::Impl {
public:
  bluescan::ConfigManager config;
  std::shared_ptr<bluescan::SerialExecutor> executor;
  std::shared_ptr<UiExecutor> uiExecutor;
  std::unique_ptr<bluescan::ScanCoordinator> coordinator;
  bool scanning = false;
};

ScannerBridge::ScannerBridge(QObject *parent)
    : QObject(parent), impl_(std::make_unique<Impl>()) {
  initializeScanner();
}

ScannerBridge::~ScannerBridge() {
  // No scanner events may arrive once the coordinator is gone
  if (impl_->executor) {
    impl_->executor->shutdown();
  }
  impl_->coordinator.reset();
}

// ============================================================================
// Properties
// ============================================================================

bool ScannerBridge::isScanning() const { return impl_->scanning; }

bool ScannerBridge::isAvailable() const {
  return impl_->coordinator != nullptr;
}

bool ScannerBridge::defaultLowEnergy() const {
  return impl_->config.get().default_mode == bluescan::ScanMode::LowEnergy;
}

// ============================================================================
// Initialization
// ============================================================================

void ScannerBridge::initializeScanner() {
  auto loaded = impl_->config.init();
  if (loaded.is_error()) {
    qCWarning(lcBridge) << "Ignoring config file"
                        << QString::fromStdString(
                               impl_->config.config_path().string())
                        << ":" << toQString(loaded.error().to_string());
  }

  bluescan::ScanConfig config = impl_->config.get();
  auto platform = bluescan::create_platform(config);
  if (platform.is_error()) {
    qCWarning(lcBridge) << "Failed to open radio:"
                        << toQString(platform.error().to_string());

    // Queued so the window has connected its slots by then
    bluescan::Error error = platform.error();
    QMetaObject::invokeMethod(
        this,
        [this, error]() {
          emit errorOccurred(errorTitle(error.code), errorText(error));
        },
        Qt::QueuedConnection);
    return;
  }

  impl_->executor = std::make_shared<bluescan::SerialExecutor>();
  impl_->uiExecutor = std::make_shared<UiExecutor>(this);
  impl_->coordinator = std::make_unique<bluescan::ScanCoordinator>(
      platform.value(), impl_->executor, config);
  impl_->coordinator->set_callback_executor(impl_->uiExecutor);

  setupCallbacks();
  qCInfo(lcBridge) << "Scanner ready, config"
                   << QString::fromStdString(
                          impl_->config.config_path().string());
}

void ScannerBridge::setupCallbacks() {
  // All of these run on the GUI thread via the UiExecutor
  impl_->coordinator->on_device_found(
      [this](const bluescan::DeviceRecord &record) {
        DeviceInfo info;
        info.name = toQString(record.name());
        info.address = toQString(record.address());
        info.category = toQString(record.category());
        emit deviceFound(info);
      });

  impl_->coordinator->on_scanning_changed([this](bool scanning) {
    impl_->scanning = scanning;
    emit scanningChanged(scanning);
  });

  impl_->coordinator->on_scan_complete(
      [this](const bluescan::ScanOutcome &outcome) {
        qCInfo(lcBridge) << "Scan" << outcome.session_id
                         << bluescan::scan_mode_name(outcome.mode)
                         << bluescan::completion_reason_name(outcome.reason)
                         << "devices:" << outcome.device_count;

        // A newer scan may have started before this arrived
        if (impl_->coordinator->session_id() == outcome.session_id) {
          auto acknowledged = impl_->coordinator->acknowledge();
          if (acknowledged.is_error()) {
            qCWarning(lcBridge) << "Session not acknowledged:"
                                << toQString(acknowledged.error().to_string());
          }
        }

        int count = static_cast<int>(outcome.device_count);
        QString summary;
        switch (outcome.reason) {
        case bluescan::CompletionReason::Cancelled:
          summary = QString("Scan stopped, %1 device(s)").arg(count);
          break;
        case bluescan::CompletionReason::Failed:
          summary = QString("Scan failed, %1 device(s)").arg(count);
          emit errorOccurred("Scan Failed", errorText(outcome.error));
          break;
        default:
          summary = QString("Scan complete, %1 device(s)").arg(count);
          break;
        }
        emit scanCompleted(count, summary);
      });

  impl_->coordinator->on_error([](const bluescan::Error &error) {
    qCWarning(lcBridge) << toQString(error.to_string());
  });
}

// ============================================================================
// Scanning
// ============================================================================

void ScannerBridge::startScan(bool lowEnergy) {
  if (!impl_->coordinator) {
    emit errorOccurred("Bluetooth Unavailable",
                       "No Bluetooth backend could be opened.");
    return;
  }

  auto mode =
      lowEnergy ? bluescan::ScanMode::LowEnergy : bluescan::ScanMode::Classic;
  auto result = impl_->coordinator->start_scan(mode);
  if (result.is_error()) {
    qCWarning(lcBridge) << "Start refused:"
                        << toQString(result.error().to_string());
    if (result.error().code != bluescan::ErrorCode::ScanInProgress) {
      emit errorOccurred(errorTitle(result.error().code),
                         errorText(result.error()));
    }
  }
}

void ScannerBridge::cancelScan() {
  if (!impl_->coordinator) {
    return;
  }
  auto mode = impl_->coordinator->active_mode();
  if (mode) {
    impl_->coordinator->cancel_scan(*mode);
  }
}
