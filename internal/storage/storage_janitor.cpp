#include "storage_janitor.hpp"

#include "internal/observability/logging.hpp"

namespace chunkcam::storage {

using chunkcam::observability::StringField;

StorageJanitor::StorageJanitor(std::shared_ptr<FileStore> files, std::shared_ptr<settings::SettingsStore> settings, std::chrono::seconds interval)
    : files_(std::move(files)), settings_(std::move(settings)), interval_(interval) {
}

StorageJanitor::~StorageJanitor() {
  Stop();
}

void StorageJanitor::Start() {
  if (running_.exchange(true)) return;

  {
    std::lock_guard lock(mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread(&StorageJanitor::Loop, this);
}

void StorageJanitor::Stop() {
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();

  if (thread_.joinable()) thread_.join();
  running_ = false;
}

CleanupReport StorageJanitor::EnforceQuotaIfNeeded() {
  const auto policy = settings_->Get();

  CleanupReport report;
  report.quota = files_->EnforceQuota(settings::MaxLocalStorageBytes(policy));

  if (policy.auto_delete_old_files()) {
    report.aged_out = files_->DeleteOlderThan(kMaxFileAge);
  }
  return report;
}

void StorageJanitor::Loop() {
  std::unique_lock lock(mutex_);

  while (!stop_requested_) {
    lock.unlock();
    try {
      EnforceQuotaIfNeeded();
    } catch (const std::exception& e) {
      CHUNKCAM_LOG_ERROR("storage cleanup pass failed", {StringField("error", e.what())});
    }
    lock.lock();

    cv_.wait_for(lock, interval_, [&] { return stop_requested_; });
  }
}

} // namespace chunkcam::storage
