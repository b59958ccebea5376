#include "internal/db/sqlite/sqlite_kv_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "tests/unit/test_support.hpp"

namespace {

using chunkcam::db::sqlite::SqliteDB;
using chunkcam::db::sqlite::SqliteKeyValueStore;
using chunkcam::testing::TempDir;

std::shared_ptr<SqliteKeyValueStore> Open(const TempDir& dir) {
  auto db = std::make_shared<SqliteDB>((dir.path() / "kv.db").string(), true);
  return std::make_shared<SqliteKeyValueStore>(db);
}

void TestMissingKeyLoadsNothing() {
  TempDir dir("chunkcam_sqlite_kv");
  auto    store = Open(dir);
  assert(!store->Load("upload_queue").has_value());
}

void TestSaveOverwritesAndErases() {
  TempDir dir("chunkcam_sqlite_kv");
  auto    store = Open(dir);

  store->Save("k", "first");
  store->Save("k", "second");
  assert(*store->Load("k") == "second");

  store->Erase("k");
  assert(!store->Load("k").has_value());

  // erasing an absent key is fine
  store->Erase("k");
}

void TestBinaryBlobsSurviveReopen() {
  TempDir           dir("chunkcam_sqlite_kv");
  const std::string blob("\x00\x01\xff payload \x00 tail", 18);

  {
    auto store = Open(dir);
    store->Save("upload_queue", blob);
    store->Save("app_settings", R"({"video_quality":"720p"})");
  }

  auto reopened = Open(dir);
  assert(*reopened->Load("upload_queue") == blob);
  assert(*reopened->Load("app_settings") == R"({"video_quality":"720p"})");
}

void TestConcurrentWritersShareOneConnection() {
  TempDir dir("chunkcam_sqlite_kv");
  auto    store = Open(dir);

  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([store, t] {
      for (int i = 0; i < 50; ++i) {
        store->Save("key_" + std::to_string(t), std::to_string(i));
        (void)store->Load("key_" + std::to_string(t));
      }
    });
  }
  for (auto& w : writers) w.join();

  for (int t = 0; t < 4; ++t) {
    assert(*store->Load("key_" + std::to_string(t)) == "49");
  }
}

} // namespace

int main() {
  TestMissingKeyLoadsNothing();
  TestSaveOverwritesAndErases();
  TestBinaryBlobsSurviveReopen();
  TestConcurrentWritersShareOneConnection();

  std::cout << "chunkcam_unit_sqlite_kv_store: pass\n";
  return 0;
}
