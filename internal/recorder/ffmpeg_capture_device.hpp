#pragma once

#include <sys/types.h>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config.pb.h"
#include "internal/recorder/capture_device.hpp"

namespace chunkcam::recorder {

/*
  CaptureDevice backed by an ffmpeg subprocess reading v4l2 video and
  (optionally) ALSA audio.

  Each take is one ffmpeg process writing into the staging directory. The
  process is bounded by `-t max_duration`; StopTake interrupts it with
  SIGINT so ffmpeg writes the container trailer, then reaps it.
*/
class FfmpegCaptureDevice final : public CaptureDevice {
 public:
  explicit FfmpegCaptureDevice(const chunkcam::runtime::config::CaptureConfig& config);
  ~FfmpegCaptureDevice() override;

  TakeHandle StartTake(const TakeOptions& options) override;
  TakeResult StopTake(TakeHandle handle) override;

  // Exposed for tests.
  std::vector<std::string> BuildArguments(const TakeOptions& options, const std::filesystem::path& output) const;

  static std::string VideoSizeFor(const std::string& quality);

 private:
  struct Take {
    pid_t                 pid = -1;
    std::filesystem::path output;
  };

  chunkcam::runtime::config::CaptureConfig config_;

  std::mutex                             mutex_;
  std::unordered_map<TakeHandle, Take>   takes_;
  TakeHandle                             next_handle_ = 1;
};

} // namespace chunkcam::recorder
