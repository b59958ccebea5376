#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/db/api/key_value_store.hpp"
#include "internal/recorder/chunk_recorder.hpp"
#include "internal/settings/settings_service.hpp"
#include "internal/storage/file_store.hpp"
#include "internal/storage/storage_janitor.hpp"
#include "internal/upload/upload_queue.hpp"
#include "internal/util/scheduler.hpp"

namespace chunkcam::factory {

/*
  Application

  Owns all long-lived components. Everything here lives for the lifetime of
  the process. Building does not start any thread; Start() does.
*/
struct Application {
  std::string device_id;

  std::shared_ptr<db::KeyValueStore>         store;
  std::shared_ptr<settings::SettingsService> settings;
  std::shared_ptr<storage::FileStore>        files;

  std::shared_ptr<util::TimerScheduler> recorder_scheduler;
  std::shared_ptr<util::TimerScheduler> queue_scheduler;

  std::shared_ptr<upload::UploadQueue>      queue;
  std::shared_ptr<recorder::ChunkRecorder>  recorder;
  std::shared_ptr<storage::StorageJanitor>  janitor;

  // Starts schedulers and the janitor, then loads and resumes the queue.
  void Start();

  // Stops recording, cancels uploads in flight, then stops every background
  // thread. Idempotent.
  void Stop();
};

// File both binaries flock before touching persisted state: beside the
// SQLite database, else beside the recordings directory.
std::filesystem::path InstanceLockPath(const chunkcam::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::KeyValueStore> BuildStore(const chunkcam::runtime::config::RuntimeConfig& config);

// Configured id, else the persisted one, else a fresh UUID which is persisted.
std::string ResolveDeviceId(const chunkcam::runtime::config::RuntimeConfig& config, db::KeyValueStore& store);

/*
  Build

  The composition root. It is the ONLY place that knows concrete types for
  persistence, capture, transport and network state.
*/
Application Build(const chunkcam::runtime::config::RuntimeConfig& config);

} // namespace chunkcam::factory
