#include "factory.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include "internal/db/memory/memory_kv_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_kv_store.hpp"
#include "internal/grpc/grpc_upload_transport.hpp"
#include "internal/observability/logging.hpp"
#include "internal/recorder/ffmpeg_capture_device.hpp"
#include "internal/upload/sysfs_network_monitor.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace chunkcam::factory {

namespace {

constexpr const char* kDeviceIdKey = "device_id";

} // namespace

std::filesystem::path InstanceLockPath(const chunkcam::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path() != ":memory:") {
    return std::filesystem::path(database.sqlite().path() + ".lock");
  }

  std::filesystem::path recordings(config.device().recordings_dir());
  if (!recordings.has_filename()) recordings = recordings.parent_path();
  return recordings.parent_path() / ("." + recordings.filename().string() + ".lock");
}

std::shared_ptr<db::KeyValueStore> BuildStore(const chunkcam::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    return std::make_shared<db::sqlite::SqliteKeyValueStore>(std::move(sqlite_db));
  }

  return std::make_shared<db::memory::MemoryKeyValueStore>();
}

std::string ResolveDeviceId(const chunkcam::runtime::config::RuntimeConfig& config, db::KeyValueStore& store) {
  if (!config.device().device_id().empty()) return config.device().device_id();

  if (auto stored = store.Load(kDeviceIdKey); stored && !stored->empty()) return *stored;

  auto id = util::GenerateUUIDString();
  store.Save(kDeviceIdKey, id);
  CHUNKCAM_LOG_INFO("generated device id", {observability::StringField("device_id", id)});
  return id;
}

/*
    Build full application dependency graph
*/
Application Build(const chunkcam::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence and policy
  // ------------------------------------------------------------------
  app.store     = BuildStore(config);
  app.settings  = std::make_shared<settings::SettingsService>(app.store);
  app.device_id = ResolveDeviceId(config, *app.store);

  auto clock = std::make_shared<util::SystemClockSource>();

  app.files = std::make_shared<storage::FileStore>(config.device().recordings_dir(), clock);
  app.files->EnsureDirectory();

  // ------------------------------------------------------------------
  // Upload side
  // ------------------------------------------------------------------
  app.queue_scheduler = std::make_shared<util::TimerScheduler>("upload-queue");

  auto transport = grpc::GrpcUploadTransport::FromConfig(config.upload());
  auto network   = std::make_shared<upload::SysfsNetworkMonitor>();

  app.queue = std::make_shared<upload::UploadQueue>(app.store, app.settings, app.files, transport, network, app.queue_scheduler, clock, app.device_id);

  // Eviction must never take a file the queue still has to send.
  std::weak_ptr<upload::UploadQueue> weak_queue = app.queue;
  app.files->SetProtectedPathPredicate([weak_queue](const std::filesystem::path& path) {
    auto queue = weak_queue.lock();
    return queue && queue->IsReferenced(path);
  });

  // ------------------------------------------------------------------
  // Recording side
  // ------------------------------------------------------------------
  app.recorder_scheduler = std::make_shared<util::TimerScheduler>("recorder");

  auto device  = std::make_shared<recorder::FfmpegCaptureDevice>(config.capture());
  app.recorder = std::make_shared<recorder::ChunkRecorder>(device, app.queue, app.files, app.recorder_scheduler, clock, app.device_id);

  app.janitor = std::make_shared<storage::StorageJanitor>(app.files, app.settings, std::chrono::seconds(config.janitor().interval_seconds()));

  return app;
}

void Application::Start() {
  recorder_scheduler->Start();
  queue_scheduler->Start();
  janitor->Start();
  queue->Initialize();
}

void Application::Stop() {
  if (recorder) recorder->Stop();
  // a pass blocked on the network would otherwise hold up the scheduler join
  if (queue) queue->Shutdown();
  if (janitor) janitor->Stop();
  if (recorder_scheduler) recorder_scheduler->Stop();
  if (queue_scheduler) queue_scheduler->Stop();
}

} // namespace chunkcam::factory
