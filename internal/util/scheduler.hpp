#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace chunkcam::util {

/*
  Handle to a scheduled task.

  Cancel() is idempotent and safe from any thread, including from inside the
  task itself. A default constructed handle refers to nothing.
*/
class TaskHandle {
 public:
  TaskHandle() = default;
  explicit TaskHandle(std::shared_ptr<std::atomic<bool>> cancelled) : cancelled_(std::move(cancelled)) {
  }

  void Cancel() {
    if (cancelled_) cancelled_->store(true);
  }

  bool Cancelled() const {
    return cancelled_ && cancelled_->load();
  }

  bool Valid() const {
    return cancelled_ != nullptr;
  }

 private:
  std::shared_ptr<std::atomic<bool>> cancelled_;
};

/*
  Cancellable delayed execution.

  Rotation timers and retry backoff go through this so that tests can drive
  time explicitly.
*/
class TaskScheduler {
 public:
  using Task = std::function<void()>;

  virtual ~TaskScheduler() = default;

  virtual TaskHandle Schedule(std::chrono::milliseconds delay, Task task) = 0;
};

/*
  Single background thread executing tasks in deadline order.

  Tasks run one at a time on the scheduler thread; a task that throws is
  logged and does not stop the thread.
*/
class TimerScheduler final : public TaskScheduler {
 public:
  explicit TimerScheduler(std::string name);
  ~TimerScheduler() override;

  TimerScheduler(const TimerScheduler&)            = delete;
  TimerScheduler& operator=(const TimerScheduler&) = delete;

  void Start();
  void Stop();

  TaskHandle Schedule(std::chrono::milliseconds delay, Task task) override;

 private:
  using SteadyClock = std::chrono::steady_clock;

  struct Entry {
    SteadyClock::time_point            deadline;
    uint64_t                           sequence;
    Task                               task;
    std::shared_ptr<std::atomic<bool>> cancelled;
  };

  struct Later {
    bool operator()(const Entry& a, const Entry& b) const {
      if (a.deadline != b.deadline) return a.deadline > b.deadline;
      return a.sequence > b.sequence;
    }
  };

  void Run();

  std::string name_;

  std::mutex                                      mutex_;
  std::condition_variable                         cv_;
  std::priority_queue<Entry, std::vector<Entry>, Later> queue_;
  uint64_t                                        next_sequence_ = 0;
  bool                                            shutdown_      = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace chunkcam::util
