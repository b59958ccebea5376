#include "internal/upload/upload_queue.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "internal/model/upload_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/non_critical.hpp"
#include "internal/util/uuid.hpp"

namespace chunkcam::upload {

namespace fs = std::filesystem;

using chunkcam::v1::UPLOAD_STATUS_COMPLETED;
using chunkcam::v1::UPLOAD_STATUS_FAILED;
using chunkcam::v1::UPLOAD_STATUS_PENDING;
using chunkcam::v1::UPLOAD_STATUS_UNSPECIFIED;
using chunkcam::v1::UPLOAD_STATUS_UPLOADING;

namespace {

std::string ContentTypeFor(const fs::path& path) {
  const auto ext = path.extension().string();
  if (ext == ".mkv") return "video/x-matroska";
  if (ext == ".mov") return "video/quicktime";
  if (ext == ".webm") return "video/webm";
  return "video/mp4";
}

} // namespace

UploadQueue::UploadQueue(std::shared_ptr<db::KeyValueStore> store, std::shared_ptr<settings::SettingsStore> settings,
                         std::shared_ptr<storage::FileStore> files, std::shared_ptr<UploadTransport> transport,
                         std::shared_ptr<NetworkMonitor> network, std::shared_ptr<util::TaskScheduler> scheduler,
                         std::shared_ptr<util::ClockSource> clock, std::string device_id, UploadQueueOptions options)
    : store_(std::move(store)), settings_(std::move(settings)), files_(std::move(files)), transport_(std::move(transport)),
      network_(std::move(network)), scheduler_(std::move(scheduler)), clock_(std::move(clock)), device_id_(std::move(device_id)),
      options_(options) {
  if (options_.batch_size == 0) options_.batch_size = 1;
}

UploadQueue::~UploadQueue() {
  std::lock_guard lock(mutex_);
  for (auto& [id, handle] : retry_timers_) handle.Cancel();
}

void UploadQueue::Initialize() {
  Versioned snapshot;
  bool     has_pending = false;
  {
    std::lock_guard lock(mutex_);
    items_.clear();

    const auto blob = store_->Load(kSnapshotKey);
    if (blob) {
      chunkcam::v1::UploadQueueSnapshot stored;
      if (stored.ParseFromString(*blob)) {
        items_.assign(stored.items().begin(), stored.items().end());
      } else {
        CHUNKCAM_LOG_ERROR("persisted upload queue is unreadable, starting empty");
      }
    }

    uint64_t recovered = 0;
    for (auto& item : items_) {
      // an upload never survives the process that started it
      if (item.status() == UPLOAD_STATUS_UPLOADING) {
        item.set_status(UPLOAD_STATUS_PENDING);
        item.set_progress_percent(0);
        ++recovered;
      }
      if (item.status() == UPLOAD_STATUS_PENDING) has_pending = true;
    }

    snapshot = recovered > 0 ? PersistLocked() : VersionLocked();

    CHUNKCAM_LOG_INFO("upload queue loaded", {observability::IntField("items", static_cast<int64_t>(items_.size())),
                                              observability::IntField("recovered", static_cast<int64_t>(recovered))});
  }

  Notify(std::move(snapshot));
  if (has_pending) TriggerProcessing();
}

void UploadQueue::Enqueue(const model::Chunk& chunk) {
  AddChunk(chunk);
}

std::string UploadQueue::AddChunk(const model::Chunk& chunk) {
  UploadQueueItem item;
  item.set_id(util::GenerateUUIDString());
  item.set_file_name(chunk.file_name());
  item.set_file_path(chunk.path().string());
  item.set_file_size_bytes(chunk.size_bytes());
  item.set_created_at_ms(util::ToUnixMillis(clock_->Now()));
  item.set_status(UPLOAD_STATUS_PENDING);
  item.set_progress_percent(0);
  item.set_retry_count(0);

  auto* metadata = item.mutable_metadata();
  metadata->set_chunk_index(chunk.sequence_index());
  metadata->set_duration_ms(chunk.duration_ms());
  metadata->set_recorded_at_ms(chunk.recorded_at_ms());

  Versioned snapshot;
  {
    std::lock_guard lock(mutex_);
    items_.push_back(item);
    snapshot = PersistLocked();
  }

  CHUNKCAM_LOG_INFO("chunk queued for upload", {observability::StringField("id", item.id()), observability::StringField("file", item.file_name())});

  Notify(std::move(snapshot));
  TriggerProcessing();
  return item.id();
}

void UploadQueue::ProcessQueue() {
  {
    std::lock_guard lock(pass_mutex_);
    if (processing_) {
      rerun_requested_ = true;
      return;
    }
    processing_ = true;
  }

  for (;;) {
    try {
      RunPass();
    } catch (const std::exception& e) {
      CHUNKCAM_LOG_ERROR("upload pass failed", {observability::StringField("error", e.what())});
    }

    std::lock_guard lock(pass_mutex_);
    if (!rerun_requested_) {
      processing_ = false;
      return;
    }
    rerun_requested_ = false;
  }
}

void UploadQueue::RunPass() {
  const auto settings = settings_->Get();
  if (settings.wifi_only_upload() && !network_->IsOnWifi()) {
    CHUNKCAM_LOG_DEBUG("upload pass skipped, waiting for wifi");
    return;
  }

  std::vector<std::string> pending;
  {
    std::lock_guard lock(mutex_);
    for (const auto& item : items_) {
      if (item.status() == UPLOAD_STATUS_PENDING) pending.push_back(item.id());
    }
  }
  if (pending.empty()) return;

  CHUNKCAM_LOG_DEBUG("upload pass started", {observability::IntField("pending", static_cast<int64_t>(pending.size()))});

  for (size_t begin = 0; begin < pending.size(); begin += options_.batch_size) {
    const size_t end = std::min(pending.size(), begin + options_.batch_size);

    std::vector<std::future<UploadStatus>> batch;
    batch.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
      batch.push_back(std::async(std::launch::async, [this, id = pending[i]] { return UploadItem(id); }));
    }
    for (auto& f : batch) f.get();
  }
}

UploadStatus UploadQueue::UploadItem(const std::string& id) {
  std::promise<UploadStatus>       promise;
  std::shared_future<UploadStatus> existing;
  {
    std::lock_guard lock(mutex_);
    auto            it = in_flight_.find(id);
    if (it != in_flight_.end()) {
      existing = it->second;
    } else {
      const auto* item = FindLocked(id);
      if (!item) return UPLOAD_STATUS_UNSPECIFIED;
      if (stopping_ || item->status() != UPLOAD_STATUS_PENDING) return item->status();
      in_flight_.emplace(id, promise.get_future().share());
    }
  }

  if (existing.valid()) return existing.get();

  UploadStatus result = UPLOAD_STATUS_UNSPECIFIED;
  try {
    result = RunUpload(id);
  } catch (const std::exception& e) {
    result = HandleFailure(id, e.what(), true);
  }

  {
    std::lock_guard lock(mutex_);
    in_flight_.erase(id);
  }
  promise.set_value(result);
  return result;
}

UploadStatus UploadQueue::RunUpload(const std::string& id) {
  UploadQueueItem item;
  Versioned       snapshot;
  {
    std::lock_guard lock(mutex_);
    auto*           current = FindLocked(id);
    if (!current) return UPLOAD_STATUS_UNSPECIFIED;
    if (stopping_ || current->status() != UPLOAD_STATUS_PENDING) return current->status();

    TransitionLocked(*current, UPLOAD_STATUS_UPLOADING);
    current->set_progress_percent(0);
    item     = *current;
    snapshot = PersistLocked();
  }
  Notify(std::move(snapshot));

  const fs::path  path = item.file_path();
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return HandleFailure(id, "file not found: " + path.string(), false);
  }

  UploadRequest request;
  request.file_path    = path;
  request.file_name    = item.file_name();
  request.size_bytes   = item.file_size_bytes();
  request.content_type = ContentTypeFor(path);
  request.metadata     = item.metadata();
  request.metadata.set_device_id(device_id_);
  request.metadata.set_platform(kPlatform);

  UploadReceipt receipt;
  try {
    receipt = transport_->Upload(request, [this, &id](uint32_t percent) { UpdateProgress(id, percent); });
  } catch (const util::UploadError& e) {
    return HandleFailure(id, e.what(), e.retryable());
  }

  {
    std::lock_guard lock(mutex_);
    auto*           current = FindLocked(id);
    // removed while uploading
    if (!current) return UPLOAD_STATUS_COMPLETED;

    TransitionLocked(*current, UPLOAD_STATUS_COMPLETED);
    current->set_progress_percent(100);
    current->set_remote_reference(receipt.remote_reference);
    current->clear_last_error();
    snapshot = PersistLocked();
  }
  CancelRetry(id);
  Notify(std::move(snapshot));

  CHUNKCAM_LOG_INFO("chunk uploaded", {observability::StringField("id", id), observability::StringField("remote", receipt.remote_reference)});

  if (settings_->Get().delete_after_upload()) {
    util::RunNonCritical("delete_after_upload", [&] {
      if (!files_->Remove(path)) throw std::runtime_error("could not delete " + path.string());
    });
  }
  return UPLOAD_STATUS_COMPLETED;
}

UploadStatus UploadQueue::HandleFailure(const std::string& id, const std::string& error, bool retryable) {
  const uint32_t max_retries = settings_->Get().max_retry_attempts();

  UploadStatus                             status = UPLOAD_STATUS_UNSPECIFIED;
  std::optional<std::chrono::milliseconds> retry_in;
  Versioned                                snapshot;
  uint32_t                                 retry_count = 0;
  bool                                     interrupted = false;
  {
    std::lock_guard lock(mutex_);
    auto*           item = FindLocked(id);
    if (!item) return UPLOAD_STATUS_UNSPECIFIED;
    if (item->status() != UPLOAD_STATUS_UPLOADING) return item->status();

    item->set_progress_percent(0);
    if (stopping_) {
      // interrupted by shutdown, not by the remote: resumes on the next start
      interrupted = true;
      TransitionLocked(*item, UPLOAD_STATUS_PENDING);
    } else {
      item->set_last_error(error);
      if (retryable && item->retry_count() < max_retries) {
        item->set_retry_count(item->retry_count() + 1);
        TransitionLocked(*item, UPLOAD_STATUS_PENDING);
        retry_in = RetryDelay(item->retry_count());
      } else {
        TransitionLocked(*item, UPLOAD_STATUS_FAILED);
      }
    }
    status      = item->status();
    retry_count = item->retry_count();
    snapshot    = PersistLocked();
  }
  Notify(std::move(snapshot));

  if (interrupted) {
    CHUNKCAM_LOG_INFO("chunk upload interrupted by shutdown", {observability::StringField("id", id)});
    return status;
  }

  CHUNKCAM_LOG_WARN("chunk upload failed", {observability::StringField("id", id), observability::StringField("error", error),
                                            observability::BoolField("retryable", retryable),
                                            observability::IntField("retry_count", retry_count),
                                            observability::StringField("status", model::StatusName(status))});

  if (retry_in) ScheduleRetry(id, *retry_in);
  return status;
}

void UploadQueue::UpdateProgress(const std::string& id, uint32_t percent) {
  Versioned snapshot;
  {
    std::lock_guard lock(mutex_);
    auto*           item = FindLocked(id);
    if (!item || item->status() != UPLOAD_STATUS_UPLOADING) return;
    item->set_progress_percent(std::min<uint32_t>(percent, 100));
    snapshot = VersionLocked();
  }
  Notify(std::move(snapshot));
}

void UploadQueue::RetryUpload(const std::string& id) {
  Versioned snapshot;
  {
    std::lock_guard lock(mutex_);
    auto*           item = FindLocked(id);
    if (!item) throw util::NotFound("upload not found: " + id);
    if (item->status() != UPLOAD_STATUS_FAILED) {
      throw util::InvalidState(std::string("only failed uploads can be retried, item is ") + model::StatusName(item->status()));
    }

    TransitionLocked(*item, UPLOAD_STATUS_PENDING);
    item->set_retry_count(0);
    item->set_progress_percent(0);
    item->clear_last_error();
    snapshot = PersistLocked();
  }
  Notify(std::move(snapshot));
  TriggerProcessing();
}

void UploadQueue::RemoveFromQueue(const std::string& id) {
  fs::path path;
  Versioned snapshot;
  {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(items_.begin(), items_.end(), [&](const UploadQueueItem& item) { return item.id() == id; });
    if (it == items_.end()) throw util::NotFound("upload not found: " + id);

    path = it->file_path();
    items_.erase(it);
    snapshot = PersistLocked();
  }
  CancelRetry(id);

  util::RunNonCritical("remove_backing_file", [&] {
    if (!files_->Remove(path)) throw std::runtime_error("could not delete " + path.string());
  });

  Notify(std::move(snapshot));
}

uint64_t UploadQueue::ClearCompleted() {
  uint64_t removed = 0;
  Versioned snapshot;
  {
    std::lock_guard lock(mutex_);
    const auto before = items_.size();
    items_.erase(std::remove_if(items_.begin(), items_.end(), [](const UploadQueueItem& item) { return item.status() == UPLOAD_STATUS_COMPLETED; }),
                 items_.end());
    removed  = before - items_.size();
    snapshot = PersistLocked();
  }
  Notify(std::move(snapshot));
  return removed;
}

void UploadQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    if (stopping_) return;
    stopping_ = true;
    for (auto& [id, handle] : retry_timers_) handle.Cancel();
    retry_timers_.clear();
  }

  CHUNKCAM_LOG_INFO("upload queue shutting down");
  transport_->Shutdown();
}

UploadQueue::Snapshot UploadQueue::GetSnapshot() const {
  std::lock_guard lock(mutex_);
  return items_;
}

QueueStats UploadQueue::Stats() const {
  std::lock_guard lock(mutex_);

  QueueStats stats;
  for (const auto& item : items_) {
    ++stats.total;
    stats.total_bytes += item.file_size_bytes();
    switch (item.status()) {
      case UPLOAD_STATUS_PENDING:
        ++stats.pending;
        break;
      case UPLOAD_STATUS_UPLOADING:
        ++stats.uploading;
        break;
      case UPLOAD_STATUS_COMPLETED:
        ++stats.completed;
        stats.uploaded_bytes += item.file_size_bytes();
        break;
      case UPLOAD_STATUS_FAILED:
        ++stats.failed;
        break;
      default:
        break;
    }
  }
  return stats;
}

bool UploadQueue::IsReferenced(const fs::path& path) const {
  const auto      target = path.lexically_normal();
  std::lock_guard lock(mutex_);
  return std::any_of(items_.begin(), items_.end(), [&](const UploadQueueItem& item) {
    const bool live = item.status() == UPLOAD_STATUS_PENDING || item.status() == UPLOAD_STATUS_UPLOADING;
    return live && fs::path(item.file_path()).lexically_normal() == target;
  });
}

UploadQueue::Unsubscribe UploadQueue::OnQueueChange(Listener listener) {
  uint64_t id = 0;
  {
    std::lock_guard lock(listeners_mutex_);
    id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
  }

  std::weak_ptr<UploadQueue> weak = weak_from_this();
  return [weak, id] {
    if (auto self = weak.lock()) {
      std::lock_guard lock(self->listeners_mutex_);
      self->listeners_.erase(id);
    }
  };
}

std::chrono::milliseconds UploadQueue::RetryDelay(uint32_t retry_count) const {
  if (retry_count == 0) return options_.base_retry_delay;
  const uint32_t shift = std::min<uint32_t>(retry_count - 1, 20);
  return options_.base_retry_delay * (1ll << shift);
}

void UploadQueue::TriggerProcessing() {
  std::weak_ptr<UploadQueue> weak = weak_from_this();
  scheduler_->Schedule(std::chrono::milliseconds(0), [weak] {
    if (auto self = weak.lock()) self->ProcessQueue();
  });
}

void UploadQueue::ScheduleRetry(const std::string& id, std::chrono::milliseconds delay) {
  std::weak_ptr<UploadQueue> weak = weak_from_this();

  auto handle = scheduler_->Schedule(delay, [weak, id] {
    auto self = weak.lock();
    if (!self) return;
    {
      std::lock_guard lock(self->mutex_);
      self->retry_timers_.erase(id);
      const auto* item = self->FindLocked(id);
      if (!item || item->status() != UPLOAD_STATUS_PENDING) return;
    }
    self->ProcessQueue();
  });

  std::lock_guard lock(mutex_);
  auto            it = retry_timers_.find(id);
  if (it != retry_timers_.end()) it->second.Cancel();
  retry_timers_[id] = handle;
}

void UploadQueue::CancelRetry(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto            it = retry_timers_.find(id);
  if (it == retry_timers_.end()) return;
  it->second.Cancel();
  retry_timers_.erase(it);
}

UploadQueueItem* UploadQueue::FindLocked(const std::string& id) {
  for (auto& item : items_) {
    if (item.id() == id) return &item;
  }
  return nullptr;
}

const UploadQueueItem* UploadQueue::FindLocked(const std::string& id) const {
  for (const auto& item : items_) {
    if (item.id() == id) return &item;
  }
  return nullptr;
}

void UploadQueue::TransitionLocked(UploadQueueItem& item, UploadStatus to) {
  if (!model::CanTransition(item.status(), to)) {
    throw util::InvalidState(std::string("illegal upload transition ") + model::StatusName(item.status()) + " -> " + model::StatusName(to));
  }
  item.set_status(to);
}

UploadQueue::Versioned UploadQueue::VersionLocked() {
  return Versioned{++version_, items_};
}

UploadQueue::Versioned UploadQueue::PersistLocked() {
  chunkcam::v1::UploadQueueSnapshot stored;
  for (const auto& item : items_) *stored.add_items() = item;

  // Every save is a full snapshot, so the next successful one repairs a miss.
  try {
    store_->Save(kSnapshotKey, stored.SerializeAsString());
  } catch (const std::exception& e) {
    CHUNKCAM_LOG_ERROR("failed to persist upload queue", {observability::StringField("error", e.what())});
  }
  return VersionLocked();
}

void UploadQueue::Notify(Versioned snapshot) {
  {
    std::lock_guard lock(notify_mutex_);
    if (snapshot.version <= delivered_version_) return;
    if (!pending_notify_ || pending_notify_->version < snapshot.version) pending_notify_ = std::move(snapshot);
    // the thread already delivering picks this one up
    if (delivering_) return;
    delivering_ = true;
  }

  for (;;) {
    Versioned next;
    {
      std::lock_guard lock(notify_mutex_);
      if (!pending_notify_) {
        delivering_ = false;
        return;
      }
      next = std::move(*pending_notify_);
      pending_notify_.reset();
      delivered_version_ = next.version;
    }

    std::vector<Listener> listeners;
    {
      std::lock_guard lock(listeners_mutex_);
      listeners.reserve(listeners_.size());
      for (const auto& [id, listener] : listeners_) listeners.push_back(listener);
    }
    for (const auto& listener : listeners) {
      util::RunNonCritical("queue_listener", [&] { listener(next.items); });
    }
  }
}

} // namespace chunkcam::upload
