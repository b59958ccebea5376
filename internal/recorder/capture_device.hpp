#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace chunkcam::recorder {

struct TakeOptions {
  std::string quality;
  uint32_t    max_duration_seconds = 0;
  bool        mute_audio           = false;
};

using TakeHandle = uint64_t;

struct TakeResult {
  std::filesystem::path output_path;
};

/*
  Physical capture collaborator.

  StartTake begins one take and returns immediately; StopTake ends it and
  blocks until the output file is closed. Both throw CaptureError.
*/
class CaptureDevice {
 public:
  virtual ~CaptureDevice() = default;

  virtual TakeHandle StartTake(const TakeOptions& options) = 0;
  virtual TakeResult StopTake(TakeHandle handle)           = 0;
};

} // namespace chunkcam::recorder
