#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/key_value_store.hpp"
#include "internal/db/memory/memory_kv_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_kv_store.hpp"
#include "internal/settings/settings_service.hpp"
#include "internal/upload/upload_queue.hpp"
#include "tests/unit/test_support.hpp"

namespace {

namespace fs = std::filesystem;

using chunkcam::db::KeyValueStore;
using chunkcam::testing::TempDir;
using chunkcam::testing::WriteFile;

/*
  Every backend must honour the same KeyValueStore contract. Backends that
  can survive a restart are additionally checked across one.
*/
struct BackendFactory {
  std::string                                          name;
  std::function<std::shared_ptr<KeyValueStore>()>      open;
  bool                                                 durable = false;
};

std::vector<BackendFactory> Backends(const TempDir& dir) {
  auto memory = std::make_shared<chunkcam::db::memory::MemoryKeyValueStore>();

  const auto sqlite_path = (dir.path() / "parity.db").string();
  return {
      BackendFactory{"memory", [memory] { return memory; }, false},
      BackendFactory{"sqlite",
                     [sqlite_path] {
                       auto db = std::make_shared<chunkcam::db::sqlite::SqliteDB>(sqlite_path, true);
                       return std::make_shared<chunkcam::db::sqlite::SqliteKeyValueStore>(db);
                     },
                     true},
  };
}

void VerifyContract(KeyValueStore& store) {
  assert(!store.Load("missing").has_value());

  store.Save("a", "1");
  store.Save("a", "2");
  assert(*store.Load("a") == "2");

  store.Save("empty", "");
  assert(store.Load("empty").has_value());
  assert(store.Load("empty")->empty());

  store.Erase("a");
  assert(!store.Load("a").has_value());
}

void VerifySettingsSurvive(const BackendFactory& backend) {
  {
    chunkcam::settings::SettingsService service(backend.open());
    chunkcam::v1::Settings              partial;
    partial.set_video_quality("1080p");
    partial.set_max_local_storage_gb(5.0);
    service.Update(partial);
  }

  chunkcam::settings::SettingsService reopened(backend.open());
  const auto                          settings = reopened.Get();
  assert(settings.video_quality() == "1080p");
  assert(settings.max_local_storage_gb() == 5.0);
  assert(settings.chunk_duration_minutes() == 5);
}

void VerifyQueueSurvives(const BackendFactory& backend, const TempDir& dir) {
  auto clock     = std::make_shared<chunkcam::testing::FakeClock>();
  auto files     = std::make_shared<chunkcam::storage::FileStore>(dir.path() / ("rec_" + backend.name), clock);
  auto settings  = std::make_shared<chunkcam::testing::FakeSettingsStore>();
  auto transport = std::make_shared<chunkcam::testing::FakeTransport>();
  auto network   = std::make_shared<chunkcam::testing::FakeNetworkMonitor>();
  auto scheduler = std::make_shared<chunkcam::testing::ManualScheduler>();

  auto make_queue = [&] {
    return std::make_shared<chunkcam::upload::UploadQueue>(backend.open(), settings, files, transport, network, scheduler, clock, "parity");
  };

  std::string id;
  {
    auto queue = make_queue();
    queue->Initialize();
    const auto path = WriteFile(files->Root() / "rec_parity_0.mp4", 2048);
    id              = queue->AddChunk(chunkcam::model::Chunk::FromFile(path, 1000, 1, 0));
  }

  auto queue = make_queue();
  queue->Initialize();
  const auto snapshot = queue->GetSnapshot();
  assert(snapshot.size() == 1);
  assert(snapshot[0].id() == id);
  assert(snapshot[0].status() == chunkcam::v1::UPLOAD_STATUS_PENDING);
  assert(snapshot[0].file_size_bytes() == 2048);
}

} // namespace

int main() {
  TempDir dir("chunkcam_kv_parity");

  for (const auto& backend : Backends(dir)) {
    auto store = backend.open();
    VerifyContract(*store);
    VerifySettingsSurvive(backend);
    VerifyQueueSurvives(backend, dir);
    std::cout << "  backend " << backend.name << (backend.durable ? " (durable)" : "") << ": ok\n";
  }

  std::cout << "chunkcam_integration_kv_store_parity: pass\n";
  return 0;
}
