#include "scheduler.hpp"

#include <utility>

#include "internal/observability/logging.hpp"

namespace chunkcam::util {

using chunkcam::observability::StringField;

TimerScheduler::TimerScheduler(std::string name) : name_(std::move(name)) {
}

TimerScheduler::~TimerScheduler() {
  Stop();
}

void TimerScheduler::Start() {
  if (running_.exchange(true)) return;

  {
    std::lock_guard lock(mutex_);
    shutdown_ = false;
  }
  thread_ = std::thread(&TimerScheduler::Run, this);
}

void TimerScheduler::Stop() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();

  if (thread_.joinable()) thread_.join();
  running_ = false;
}

TaskHandle TimerScheduler::Schedule(std::chrono::milliseconds delay, Task task) {
  auto cancelled = std::make_shared<std::atomic<bool>>(false);
  {
    std::lock_guard lock(mutex_);
    queue_.push(Entry{SteadyClock::now() + delay, next_sequence_++, std::move(task), cancelled});
  }
  cv_.notify_one();
  return TaskHandle(cancelled);
}

void TimerScheduler::Run() {
  std::unique_lock lock(mutex_);

  while (!shutdown_) {
    if (queue_.empty()) {
      cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });
      continue;
    }

    const auto deadline = queue_.top().deadline;
    if (SteadyClock::now() < deadline) {
      cv_.wait_until(lock, deadline);
      continue;
    }

    Entry entry = queue_.top();
    queue_.pop();

    if (entry.cancelled->load()) continue;

    lock.unlock();
    try {
      entry.task();
    } catch (const std::exception& e) {
      CHUNKCAM_LOG_ERROR("scheduled task failed", {StringField("scheduler", name_), StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace chunkcam::util
