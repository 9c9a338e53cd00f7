/**
 * @file executor.h
 * @brief Task queues that carry scan events between threads
 *
 * Radio callbacks arrive on platform threads. Scanners never act on them
 * in place: they post a task to an Executor, which runs tasks one at a
 * time in the order they were posted. Delayed tasks (the low-energy scan
 * timeout) join the back of the same queue when they fall due, so they run
 * after every result that was already queued.
 */

#ifndef BLUESCAN_EXECUTOR_H
#define BLUESCAN_EXECUTOR_H

#include "platform.h"
#include "types.h"
#include <cstdint>
#include <functional>
#include <memory>

namespace bluescan {

using Task = std::function<void()>;

/// Identifies a delayed task for cancellation. Never 0.
using TimerId = uint64_t;

/**
 * @brief Serial task queue with one-shot timers
 */
class BLUESCAN_API Executor {
public:
  virtual ~Executor() = default;

  /// Queue a task to run as soon as possible
  virtual void post(Task task) = 0;

  /// Queue a task to run once @p delay has elapsed
  virtual TimerId post_delayed(Milliseconds delay, Task task) = 0;

  /**
   * @brief Cancel a delayed task
   * @return true if the task was still pending and will not run
   */
  virtual bool cancel(TimerId id) = 0;
};

/**
 * @brief Executor backed by one worker thread
 *
 * @code
 *   auto executor = std::make_shared<SerialExecutor>();
 *   executor->post([] { handle_event(); });
 *   auto id = executor->post_delayed(std::chrono::seconds(12), on_timeout);
 *   executor->cancel(id);
 * @endcode
 */
class BLUESCAN_API SerialExecutor : public Executor {
public:
  SerialExecutor();
  ~SerialExecutor() override;

  // Non-copyable
  SerialExecutor(const SerialExecutor &) = delete;
  SerialExecutor &operator=(const SerialExecutor &) = delete;

  void post(Task task) override;
  TimerId post_delayed(Milliseconds delay, Task task) override;
  bool cancel(TimerId id) override;

  /**
   * @brief Stop the worker thread
   *
   * Pending tasks and timers are dropped. Safe to call more than once and
   * from a task running on the executor itself.
   */
  void shutdown();

  /// True when called from the worker thread
  bool is_current_thread() const;

  /// Number of queued tasks plus pending timers
  size_t pending() const;

private:
  class Impl;
  // Shared with the worker thread, which may outlive a shutdown() called
  // from one of its own tasks
  std::shared_ptr<Impl> impl_;
};

} // namespace bluescan

#endif // BLUESCAN_EXECUTOR_H
