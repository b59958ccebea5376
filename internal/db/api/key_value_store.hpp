#pragma once

#include <optional>
#include <string>

namespace chunkcam::db {

/*
  Durable blob storage keyed by name.

  Contract: Save is atomic per key and last-writer-wins; Load returns exactly
  the blob of the last successful Save, or nullopt if the key was never
  written. Backends throw std::runtime_error on I/O failure.
*/
class KeyValueStore {
 public:
  virtual ~KeyValueStore() = default;

  virtual void                       Save(const std::string& key, const std::string& blob) = 0;
  virtual std::optional<std::string> Load(const std::string& key)                          = 0;
  virtual void                       Erase(const std::string& key)                         = 0;
};

} // namespace chunkcam::db
