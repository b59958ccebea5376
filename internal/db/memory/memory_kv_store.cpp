#include "memory_kv_store.hpp"

namespace chunkcam::db::memory {

void MemoryKeyValueStore::Save(const std::string& key, const std::string& blob) {
  std::lock_guard lock(mutex_);
  values_[key] = blob;
  ++save_count_;
}

std::optional<std::string> MemoryKeyValueStore::Load(const std::string& key) {
  std::lock_guard lock(mutex_);
  auto            it = values_.find(key);
  if (it == values_.end()) return std::nullopt;
  return it->second;
}

void MemoryKeyValueStore::Erase(const std::string& key) {
  std::lock_guard lock(mutex_);
  values_.erase(key);
}

uint64_t MemoryKeyValueStore::SaveCount() const {
  std::lock_guard lock(mutex_);
  return save_count_;
}

} // namespace chunkcam::db::memory
