#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunkcam/v1/queue.pb.h"
#include "internal/db/api/key_value_store.hpp"
#include "internal/model/chunk.hpp"
#include "internal/recorder/chunk_sink.hpp"
#include "internal/settings/settings_store.hpp"
#include "internal/storage/file_store.hpp"
#include "internal/upload/network_monitor.hpp"
#include "internal/upload/upload_transport.hpp"
#include "internal/util/scheduler.hpp"
#include "internal/util/time.hpp"

namespace chunkcam::upload {

using chunkcam::v1::UploadQueueItem;
using chunkcam::v1::UploadStatus;

struct QueueStats {
  uint64_t total          = 0;
  uint64_t pending        = 0;
  uint64_t uploading      = 0;
  uint64_t completed      = 0;
  uint64_t failed         = 0;
  uint64_t total_bytes    = 0;
  uint64_t uploaded_bytes = 0;
};

struct UploadQueueOptions {
  uint32_t                  batch_size = 3;
  std::chrono::milliseconds base_retry_delay{5000};
};

/*
  Durable, retrying upload queue.

  Every status change is persisted as a full snapshot under kSnapshotKey
  before subscribers hear about it; progress updates are broadcast only.
  Subscribers see snapshots in the order they were taken. Under concurrent
  updates an intermediate snapshot may be skipped, never the newest one.
  A snapshot never contains an item whose upload survived a restart: items
  loaded as uploading are put back to pending.

  Processing runs one pass at a time. A trigger that arrives while a pass is
  running is folded into a single follow-up pass. Within a pass pending items
  go out in batches of batch_size, each batch running concurrently. An item
  is never uploaded twice at once; a second request for the same id waits on
  the first.

  Must be owned by a std::shared_ptr; timers hold weak references.
*/
class UploadQueue final : public recorder::ChunkSink, public std::enable_shared_from_this<UploadQueue> {
 public:
  using Snapshot    = std::vector<UploadQueueItem>;
  using Listener    = std::function<void(const Snapshot&)>;
  using Unsubscribe = std::function<void()>;

  static constexpr const char* kSnapshotKey = "upload_queue";
  static constexpr const char* kPlatform    = "linux";

  UploadQueue(std::shared_ptr<db::KeyValueStore> store, std::shared_ptr<settings::SettingsStore> settings,
              std::shared_ptr<storage::FileStore> files, std::shared_ptr<UploadTransport> transport,
              std::shared_ptr<NetworkMonitor> network, std::shared_ptr<util::TaskScheduler> scheduler,
              std::shared_ptr<util::ClockSource> clock, std::string device_id, UploadQueueOptions options = {});
  ~UploadQueue() override;

  UploadQueue(const UploadQueue&)            = delete;
  UploadQueue& operator=(const UploadQueue&) = delete;

  // Loads the persisted snapshot and resumes anything pending.
  void Initialize();

  void        Enqueue(const model::Chunk& chunk) override;
  std::string AddChunk(const model::Chunk& chunk);

  // Synchronous processing pass. No-op (but coalesced) while another runs.
  void ProcessQueue();

  // Returns the status the item ended in after this call.
  UploadStatus UploadItem(const std::string& id);

  // Aborts uploads in flight and starts no new ones. Interrupted items go
  // back to pending without spending a retry. Idempotent.
  void Shutdown();

  void     RetryUpload(const std::string& id);
  void     RemoveFromQueue(const std::string& id);
  uint64_t ClearCompleted();

  Snapshot    GetSnapshot() const;
  QueueStats  Stats() const;
  bool        IsReferenced(const std::filesystem::path& path) const;
  Unsubscribe OnQueueChange(Listener listener);

  // Backoff before retry attempt n (1-based): base * 2^(n-1).
  std::chrono::milliseconds RetryDelay(uint32_t retry_count) const;

 private:
  UploadStatus RunUpload(const std::string& id);
  UploadStatus HandleFailure(const std::string& id, const std::string& error, bool retryable);
  void         UpdateProgress(const std::string& id, uint32_t percent);

  void TriggerProcessing();
  void ScheduleRetry(const std::string& id, std::chrono::milliseconds delay);
  void CancelRetry(const std::string& id);
  void RunPass();

  UploadQueueItem*       FindLocked(const std::string& id);
  const UploadQueueItem* FindLocked(const std::string& id) const;
  void                   TransitionLocked(UploadQueueItem& item, UploadStatus to);

  struct Versioned {
    uint64_t version = 0;
    Snapshot items;
  };

  // Stamps the current items with the next version.
  Versioned VersionLocked();
  // Saves the current items and returns the snapshot to broadcast.
  Versioned PersistLocked();
  // Delivers snapshots in version order from one thread at a time; a
  // snapshot superseded before delivery is skipped.
  void Notify(Versioned snapshot);

  std::shared_ptr<db::KeyValueStore>       store_;
  std::shared_ptr<settings::SettingsStore> settings_;
  std::shared_ptr<storage::FileStore>      files_;
  std::shared_ptr<UploadTransport>         transport_;
  std::shared_ptr<NetworkMonitor>          network_;
  std::shared_ptr<util::TaskScheduler>     scheduler_;
  std::shared_ptr<util::ClockSource>       clock_;
  std::string                              device_id_;
  UploadQueueOptions                       options_;

  mutable std::mutex                                                 mutex_;
  std::vector<UploadQueueItem>                                       items_;
  std::unordered_map<std::string, std::shared_future<UploadStatus>> in_flight_;
  std::unordered_map<std::string, util::TaskHandle>                 retry_timers_;
  uint64_t                                                           version_ = 0;
  bool                                                               stopping_ = false;

  std::mutex pass_mutex_;
  bool       processing_      = false;
  bool       rerun_requested_ = false;

  std::mutex                    listeners_mutex_;
  std::map<uint64_t, Listener>  listeners_;
  uint64_t                      next_listener_id_ = 1;

  std::mutex               notify_mutex_;
  std::optional<Versioned> pending_notify_;
  uint64_t                 delivered_version_ = 0;
  bool                     delivering_        = false;
};

} // namespace chunkcam::upload
