#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/settings/settings_store.hpp"
#include "internal/storage/file_store.hpp"

namespace chunkcam::storage {

struct CleanupReport {
  EvictionResult quota;
  uint64_t       aged_out = 0;
};

/*
  Periodically applies the storage policy from settings.

  The recorder never deletes chunk files; cleanup happens here and in the
  upload queue only.
*/
class StorageJanitor {
 public:
  static constexpr std::chrono::hours kMaxFileAge{24};

  StorageJanitor(std::shared_ptr<FileStore> files, std::shared_ptr<settings::SettingsStore> settings, std::chrono::seconds interval);
  ~StorageJanitor();

  void Start();
  void Stop();

  // One pass: quota eviction, then age-based deletion when enabled.
  CleanupReport EnforceQuotaIfNeeded();

 private:
  void Loop();

  std::shared_ptr<FileStore>               files_;
  std::shared_ptr<settings::SettingsStore> settings_;
  std::chrono::seconds                     interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stop_requested_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace chunkcam::storage
