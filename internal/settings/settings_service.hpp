#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "chunkcam/v1/settings.pb.h"
#include "internal/db/api/key_value_store.hpp"
#include "internal/settings/settings_store.hpp"

namespace chunkcam::settings {

/*
  Persisted user settings.

  Stored as protobuf JSON under "app_settings". Stored documents are merged
  onto Defaults() so fields added by newer builds come up with their default.
*/
class SettingsService final : public SettingsStore {
 public:
  static constexpr const char* kStorageKey = "app_settings";

  explicit SettingsService(std::shared_ptr<db::KeyValueStore> store);

  static chunkcam::v1::Settings Defaults();

  // Throws InvalidSetting naming the first offending field.
  static void Validate(const chunkcam::v1::Settings& partial);

  chunkcam::v1::Settings Get() override;

  // Only fields present in `partial` are changed. Validated before anything is written.
  chunkcam::v1::Settings Update(const chunkcam::v1::Settings& partial);
  chunkcam::v1::Settings ResetToDefaults();

  std::string ExportJson();

  // Entries that fail validation are dropped; malformed JSON throws InvalidSetting.
  chunkcam::v1::Settings ImportJson(const std::string& json);

 private:
  void LoadLocked();
  void SaveLocked();

  std::shared_ptr<db::KeyValueStore> store_;

  std::mutex                            mutex_;
  std::optional<chunkcam::v1::Settings> settings_;
};

} // namespace chunkcam::settings
