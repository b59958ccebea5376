#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/instance_lock.hpp"

using chunkcam::factory::Build;
using chunkcam::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

// Uploads keep running when recording cannot start (no space, no device).
static void StartRecording(chunkcam::factory::Application& app) {
  try {
    app.recorder->Start(chunkcam::recorder::RecordingOptions::FromSettings(app.settings->Get()));
  } catch (const std::exception& e) {
    CHUNKCAM_LOG_ERROR("recording not started", {StringField("error", e.what())});
  }
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: chunkcam <config.yaml> OR chunkcam --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = chunkcam::config::ConfigLoader::LoadFromYaml(config_path);

    chunkcam::observability::InitializeLogging(config);

    // Held until exit; chunkcamctl refuses to run meanwhile.
    chunkcam::util::InstanceLock instance_lock(chunkcam::factory::InstanceLockPath(config));

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // Register signal handlers before starting threads to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();

    std::weak_ptr<chunkcam::recorder::ChunkRecorder> weak_recorder = app.recorder;
    std::shared_ptr<chunkcam::util::TimerScheduler>  scheduler     = app.recorder_scheduler;
    auto                                             settings      = app.settings;

    // A session that dies on a device error comes back after a pause when the
    // user asked for it.
    app.recorder->OnError([weak_recorder, scheduler, settings](const std::string& message) {
      if (!g_running || !settings->Get().auto_restart()) return;

      CHUNKCAM_LOG_WARN("recording will restart", {StringField("reason", message)});
      scheduler->Schedule(std::chrono::seconds(10), [weak_recorder, settings] {
        auto recorder = weak_recorder.lock();
        if (!recorder || !g_running || recorder->IsRecording()) return;
        try {
          recorder->Start(chunkcam::recorder::RecordingOptions::FromSettings(settings->Get()));
        } catch (const std::exception& e) {
          CHUNKCAM_LOG_ERROR("recording restart failed", {StringField("error", e.what())});
        }
      });
    });

    StartRecording(app);
    CHUNKCAM_LOG_INFO("chunkcam started", {StringField("device_id", app.device_id),
                                           StringField("recordings_dir", config.device().recordings_dir())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    CHUNKCAM_LOG_INFO("shutting down chunkcam");

    app.Stop();
    chunkcam::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    CHUNKCAM_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    chunkcam::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
