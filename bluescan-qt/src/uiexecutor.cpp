/**
 * @file uiexecutor.cpp
 * @brief GUI-thread executor implementation
 */

#include "uiexecutor.h"
#include <QMetaObject>
#include <QTimer>

UiExecutor::UiExecutor(QObject *context)
    : context_(context), timers_(std::make_shared<TimerState>()) {}

void UiExecutor::post(bluescan::Task task) {
  QObject *context = context_.data();
  if (!context) {
    return;
  }
  QMetaObject::invokeMethod(
      context, [task]() { task(); }, Qt::QueuedConnection);
}

bluescan::TimerId UiExecutor::post_delayed(bluescan::Milliseconds delay,
                                           bluescan::Task task) {
  bluescan::TimerId id;
  {
    std::lock_guard<std::mutex> lock(timers_->mutex);
    id = timers_->next_id++;
    timers_->pending.insert(id);
  }

  QObject *context = context_.data();
  if (!context) {
    return id;
  }

  // QTimer must be started on the context's thread
  auto timers = timers_;
  int ms = static_cast<int>(delay.count());
  QMetaObject::invokeMethod(
      context,
      [context, timers, id, ms, task]() {
        QTimer::singleShot(ms, context, [timers, id, task]() {
          {
            std::lock_guard<std::mutex> lock(timers->mutex);
            if (timers->pending.erase(id) == 0) {
              return;
            }
          }
          task();
        });
      },
      Qt::QueuedConnection);
  return id;
}

bool UiExecutor::cancel(bluescan::TimerId id) {
  std::lock_guard<std::mutex> lock(timers_->mutex);
  return timers_->pending.erase(id) > 0;
}
