/**
 * @file executor.cpp
 * @brief Single-thread serial executor
 */

#include "bluescan/executor.h"
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace bluescan {

class SerialExecutor::Impl {
public:
  using Deadline = Clock::time_point;
  using TimerKey = std::pair<Deadline, TimerId>;

  mutable std::mutex mutex;
  std::condition_variable cv;
  std::deque<Task> queue;
  std::map<TimerKey, Task> timers;                  // Ordered by deadline
  std::unordered_map<TimerId, Deadline> timer_index; // For cancel()
  TimerId next_timer_id = 1;
  bool stopping = false;
  std::thread worker;

  void run() {
    std::unique_lock<std::mutex> lock(mutex);

    while (!stopping) {
      // Timers that fell due join the back of the queue
      auto now = Clock::now();
      while (!timers.empty() && timers.begin()->first.first <= now) {
        auto it = timers.begin();
        timer_index.erase(it->first.second);
        queue.push_back(std::move(it->second));
        timers.erase(it);
      }

      if (!queue.empty()) {
        Task task = std::move(queue.front());
        queue.pop_front();

        lock.unlock();
        if (task) {
          task();
        }
        lock.lock();
        continue;
      }

      if (timers.empty()) {
        cv.wait(lock, [this] {
          return stopping || !queue.empty() || !timers.empty();
        });
      } else {
        cv.wait_until(lock, timers.begin()->first.first);
      }
    }

    queue.clear();
    timers.clear();
    timer_index.clear();
  }
};

SerialExecutor::SerialExecutor() : impl_(std::make_shared<Impl>()) {
  std::shared_ptr<Impl> impl = impl_;
  impl_->worker = std::thread([impl] { impl->run(); });
}

SerialExecutor::~SerialExecutor() { shutdown(); }

void SerialExecutor::post(Task task) {
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->stopping) {
      return;
    }
    impl_->queue.push_back(std::move(task));
  }
  impl_->cv.notify_one();
}

TimerId SerialExecutor::post_delayed(Milliseconds delay, Task task) {
  TimerId id;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    id = impl_->next_timer_id++;
    if (impl_->stopping) {
      return id;
    }

    auto deadline = Clock::now() + delay;
    impl_->timers.emplace(Impl::TimerKey(deadline, id), std::move(task));
    impl_->timer_index.emplace(id, deadline);
  }
  impl_->cv.notify_one();
  return id;
}

bool SerialExecutor::cancel(TimerId id) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  auto it = impl_->timer_index.find(id);
  if (it == impl_->timer_index.end()) {
    return false;
  }

  impl_->timers.erase(Impl::TimerKey(it->second, id));
  impl_->timer_index.erase(it);
  return true;
}

void SerialExecutor::shutdown() {
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->stopping = true;
  }
  impl_->cv.notify_all();

  if (!impl_->worker.joinable()) {
    return;
  }

  if (is_current_thread()) {
    // Called from a task; the loop exits once this task returns
    impl_->worker.detach();
  } else {
    impl_->worker.join();
  }
}

bool SerialExecutor::is_current_thread() const {
  return impl_->worker.get_id() == std::this_thread::get_id();
}

size_t SerialExecutor::pending() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->queue.size() + impl_->timers.size();
}

} // namespace bluescan
