#include "internal/recorder/ffmpeg_capture_device.hpp"

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

extern char** environ;

namespace chunkcam::recorder {

namespace fs = std::filesystem;

namespace {

std::string ErrnoMessage(const std::string& what, int err) {
  return what + ": " + std::strerror(err);
}

int WaitForExit(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) throw util::CaptureError(ErrnoMessage("waitpid failed", errno));
  }
  return status;
}

} // namespace

FfmpegCaptureDevice::FfmpegCaptureDevice(const chunkcam::runtime::config::CaptureConfig& config) : config_(config) {
}

FfmpegCaptureDevice::~FfmpegCaptureDevice() {
  std::lock_guard lock(mutex_);
  for (auto& [handle, take] : takes_) {
    if (::kill(take.pid, SIGINT) < 0 && errno != ESRCH) {
      CHUNKCAM_LOG_WARN("failed to interrupt abandoned capture", {observability::IntField("pid", take.pid), observability::StringField("error", std::strerror(errno))});
      continue;
    }
    try {
      WaitForExit(take.pid);
    } catch (const std::exception& e) {
      CHUNKCAM_LOG_WARN("failed to reap abandoned capture", {observability::IntField("pid", take.pid), observability::StringField("error", e.what())});
    }
  }
}

std::string FfmpegCaptureDevice::VideoSizeFor(const std::string& quality) {
  if (quality == "480p") return "640x480";
  if (quality == "1080p") return "1920x1080";
  return "1280x720";
}

std::vector<std::string> FfmpegCaptureDevice::BuildArguments(const TakeOptions& options, const fs::path& output) const {
  std::vector<std::string> args = {config_.ffmpeg_path(), "-hide_banner", "-loglevel", "error", "-nostdin", "-y"};

  args.insert(args.end(), {"-f", "v4l2", "-video_size", VideoSizeFor(options.quality), "-i", config_.video_device()});

  const bool with_audio = !options.mute_audio && !config_.audio_device().empty();
  if (with_audio) {
    args.insert(args.end(), {"-f", "alsa", "-i", config_.audio_device()});
  }

  if (options.max_duration_seconds > 0) {
    args.insert(args.end(), {"-t", std::to_string(options.max_duration_seconds)});
  }

  args.insert(args.end(), {"-c:v", "libx264", "-preset", "veryfast"});
  if (with_audio) {
    args.insert(args.end(), {"-c:a", "aac"});
  } else {
    args.push_back("-an");
  }

  args.push_back(output.string());
  return args;
}

TakeHandle FfmpegCaptureDevice::StartTake(const TakeOptions& options) {
  const fs::path staging = config_.staging_dir();
  std::error_code ec;
  fs::create_directories(staging, ec);
  if (ec) throw util::CaptureError("failed to create staging directory " + staging.string() + ": " + ec.message());

  std::lock_guard lock(mutex_);

  const TakeHandle handle = next_handle_++;
  const fs::path   output = staging / ("take_" + std::to_string(::getpid()) + "_" + std::to_string(handle) + "." + config_.extension());

  const auto         args = BuildArguments(options, output);
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
  argv.push_back(nullptr);

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);

  pid_t     pid = -1;
  const int rc  = ::posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), environ);
  posix_spawn_file_actions_destroy(&actions);

  if (rc != 0) throw util::CaptureError(ErrnoMessage("failed to spawn " + args.front(), rc));

  takes_[handle] = Take{pid, output};

  CHUNKCAM_LOG_DEBUG("capture take started", {observability::IntField("pid", pid), observability::StringField("output", output.string())});
  return handle;
}

TakeResult FfmpegCaptureDevice::StopTake(TakeHandle handle) {
  Take take;
  {
    std::lock_guard lock(mutex_);
    auto            it = takes_.find(handle);
    if (it == takes_.end()) throw util::CaptureError("unknown take handle " + std::to_string(handle));
    take = it->second;
    takes_.erase(it);
  }

  // ESRCH means ffmpeg already hit -t and exited; it is still ours to reap.
  if (::kill(take.pid, SIGINT) < 0 && errno != ESRCH) {
    throw util::CaptureError(ErrnoMessage("failed to signal capture process", errno));
  }

  const int status = WaitForExit(take.pid);

  std::error_code ec;
  const auto      size     = fs::file_size(take.output, ec);
  const bool      produced = !ec && size > 0;
  if (!produced) {
    std::string reason = "capture produced no output";
    if (WIFEXITED(status)) reason += " (exit code " + std::to_string(WEXITSTATUS(status)) + ")";
    if (WIFSIGNALED(status)) reason += " (signal " + std::to_string(WTERMSIG(status)) + ")";
    throw util::CaptureError(reason);
  }

  CHUNKCAM_LOG_DEBUG("capture take stopped", {observability::IntField("pid", take.pid), observability::StringField("output", take.output.string())});
  return TakeResult{take.output};
}

} // namespace chunkcam::recorder
