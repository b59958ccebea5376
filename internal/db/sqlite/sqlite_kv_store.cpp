#include "sqlite_kv_store.hpp"

#include <stdexcept>

#include "internal/util/time.hpp"

namespace chunkcam::db::sqlite {

namespace {

void Check(int rc, int expected, sqlite3* db, const char* what) {
  if (rc != expected) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteKeyValueStore::SqliteKeyValueStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  BootstrapSchema(*db_);
}

void SqliteKeyValueStore::BootstrapSchema(SqliteDB& db) {
  db.Exec("CREATE TABLE IF NOT EXISTS kv (key TEXT PRIMARY KEY, value BLOB NOT NULL, updated_at_ms INTEGER NOT NULL);");
  db.Exec("SELECT key,value,updated_at_ms FROM kv LIMIT 1;");
}

void SqliteKeyValueStore::Save(const std::string& key, const std::string& blob) {
  std::lock_guard lock(mutex_);
  Statement stmt(*db_,
                 "INSERT INTO kv (key, value, updated_at_ms) VALUES (?1, ?2, ?3) "
                 "ON CONFLICT(key) DO UPDATE SET value = excluded.value, updated_at_ms = excluded.updated_at_ms;");

  auto* raw = stmt.get();
  Check(sqlite3_bind_text(raw, 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT), SQLITE_OK, db_->Handle(), "bind key");
  Check(sqlite3_bind_blob(raw, 2, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT), SQLITE_OK, db_->Handle(), "bind value");
  Check(sqlite3_bind_int64(raw, 3, static_cast<sqlite3_int64>(util::ToUnixMillis(util::Now()))), SQLITE_OK, db_->Handle(), "bind time");
  Check(sqlite3_step(raw), SQLITE_DONE, db_->Handle(), "kv save");
}

std::optional<std::string> SqliteKeyValueStore::Load(const std::string& key) {
  std::lock_guard lock(mutex_);
  Statement stmt(*db_, "SELECT value FROM kv WHERE key = ?1;");

  auto* raw = stmt.get();
  Check(sqlite3_bind_text(raw, 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT), SQLITE_OK, db_->Handle(), "bind key");

  const int rc = sqlite3_step(raw);
  if (rc == SQLITE_DONE) return std::nullopt;
  Check(rc, SQLITE_ROW, db_->Handle(), "kv load");

  const auto* data = static_cast<const char*>(sqlite3_column_blob(raw, 0));
  const int   size = sqlite3_column_bytes(raw, 0);
  return std::string(data ? data : "", static_cast<size_t>(size));
}

void SqliteKeyValueStore::Erase(const std::string& key) {
  std::lock_guard lock(mutex_);
  Statement stmt(*db_, "DELETE FROM kv WHERE key = ?1;");

  auto* raw = stmt.get();
  Check(sqlite3_bind_text(raw, 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT), SQLITE_OK, db_->Handle(), "bind key");
  Check(sqlite3_step(raw), SQLITE_DONE, db_->Handle(), "kv erase");
}

} // namespace chunkcam::db::sqlite
