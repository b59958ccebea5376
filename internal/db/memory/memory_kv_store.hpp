#pragma once

#include <mutex>
#include <unordered_map>

#include "internal/db/api/key_value_store.hpp"

namespace chunkcam::db::memory {

class MemoryKeyValueStore final : public db::KeyValueStore {
 public:
  void                       Save(const std::string& key, const std::string& blob) override;
  std::optional<std::string> Load(const std::string& key) override;
  void                       Erase(const std::string& key) override;

  uint64_t SaveCount() const;

 private:
  mutable std::mutex                           mutex_;
  std::unordered_map<std::string, std::string> values_;
  uint64_t                                     save_count_ = 0;
};

} // namespace chunkcam::db::memory
