#pragma once

#include "chunkcam/v1/settings.pb.h"

namespace chunkcam::settings {

/*
  Read side of the user policy. Every field of the returned message is set.
*/
class SettingsStore {
 public:
  virtual ~SettingsStore() = default;

  virtual chunkcam::v1::Settings Get() = 0;
};

inline constexpr double kBytesPerGigabyte = 1024.0 * 1024.0 * 1024.0;

inline uint64_t MaxLocalStorageBytes(const chunkcam::v1::Settings& settings) {
  return static_cast<uint64_t>(settings.max_local_storage_gb() * kBytesPerGigabyte);
}

} // namespace chunkcam::settings
