#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/key_value_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace chunkcam::db::sqlite {

// One connection shared by every caller; operations are serialized.
class SqliteKeyValueStore final : public db::KeyValueStore {
 public:
  explicit SqliteKeyValueStore(std::shared_ptr<SqliteDB> db);

  void                       Save(const std::string& key, const std::string& blob) override;
  std::optional<std::string> Load(const std::string& key) override;
  void                       Erase(const std::string& key) override;

  static void BootstrapSchema(SqliteDB& db);

 private:
  std::shared_ptr<SqliteDB> db_;
  std::mutex                mutex_;
};

} // namespace chunkcam::db::sqlite
