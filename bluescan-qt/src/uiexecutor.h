/**
 * @file uiexecutor.h
 * @brief Executor that runs tasks on a QObject's thread
 */

#ifndef UIEXECUTOR_H
#define UIEXECUTOR_H

#include <QObject>
#include <QPointer>
#include <bluescan/executor.h>
#include <memory>
#include <mutex>
#include <set>

/**
 * @brief Posts tasks to the event loop of @p context's thread
 *
 * Handed to ScanCoordinator::set_callback_executor() so scan callbacks
 * arrive on the GUI thread. Tasks posted after @p context is destroyed
 * are dropped.
 */
class UiExecutor : public bluescan::Executor {
public:
  explicit UiExecutor(QObject *context);

  void post(bluescan::Task task) override;
  bluescan::TimerId post_delayed(bluescan::Milliseconds delay,
                                 bluescan::Task task) override;
  bool cancel(bluescan::TimerId id) override;

private:
  struct TimerState {
    std::mutex mutex;
    std::set<bluescan::TimerId> pending;
    bluescan::TimerId next_id = 1;
  };

  QPointer<QObject> context_;
  std::shared_ptr<TimerState> timers_;
};

#endif // UIEXECUTOR_H
