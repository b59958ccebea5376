#include "internal/util/scheduler.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace {

using chunkcam::util::TaskHandle;
using chunkcam::util::TimerScheduler;

using namespace std::chrono_literals;

class Recorder {
 public:
  void Add(int value) {
    std::lock_guard lock(mutex_);
    values_.push_back(value);
    cv_.notify_all();
  }

  bool WaitForCount(size_t count, std::chrono::milliseconds timeout = 2000ms) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return values_.size() >= count; });
  }

  std::vector<int> Values() {
    std::lock_guard lock(mutex_);
    return values_;
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::vector<int>        values_;
};

void TestTasksRunInDeadlineOrder() {
  TimerScheduler scheduler("test");
  scheduler.Start();

  Recorder seen;
  scheduler.Schedule(60ms, [&] { seen.Add(3); });
  scheduler.Schedule(20ms, [&] { seen.Add(2); });
  scheduler.Schedule(0ms, [&] { seen.Add(1); });

  assert(seen.WaitForCount(3));
  assert(seen.Values() == std::vector<int>({1, 2, 3}));
  scheduler.Stop();
}

void TestCancelledTaskNeverRuns() {
  TimerScheduler scheduler("test");
  scheduler.Start();

  Recorder   seen;
  TaskHandle cancelled = scheduler.Schedule(20ms, [&] { seen.Add(99); });
  scheduler.Schedule(50ms, [&] { seen.Add(1); });
  cancelled.Cancel();
  cancelled.Cancel();

  assert(cancelled.Cancelled());
  assert(seen.WaitForCount(1));
  assert(seen.Values() == std::vector<int>({1}));
  scheduler.Stop();
}

void TestThrowingTaskDoesNotStopTheThread() {
  TimerScheduler scheduler("test");
  scheduler.Start();

  Recorder seen;
  scheduler.Schedule(0ms, [] { throw std::runtime_error("boom"); });
  scheduler.Schedule(10ms, [&] { seen.Add(7); });

  assert(seen.WaitForCount(1));
  scheduler.Stop();
}

void TestStopDropsPendingTasks() {
  std::atomic<int> runs{0};
  {
    TimerScheduler scheduler("test");
    scheduler.Start();
    scheduler.Schedule(10s, [&] { ++runs; });
    scheduler.Stop();
  }
  assert(runs == 0);
}

void TestDefaultHandleIsInert() {
  TaskHandle handle;
  assert(!handle.Valid());
  handle.Cancel();
  assert(!handle.Cancelled());
}

} // namespace

int main() {
  TestTasksRunInDeadlineOrder();
  TestCancelledTaskNeverRuns();
  TestThrowingTaskDoesNotStopTheThread();
  TestStopDropsPendingTasks();
  TestDefaultHandleIsInert();

  std::cout << "chunkcam_unit_scheduler: pass\n";
  return 0;
}
