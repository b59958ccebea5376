#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "chunkcam/v1/settings.pb.h"
#include "internal/model/chunk.hpp"
#include "internal/recorder/capture_device.hpp"
#include "internal/recorder/chunk_sink.hpp"
#include "internal/storage/file_store.hpp"
#include "internal/util/scheduler.hpp"
#include "internal/util/time.hpp"

namespace chunkcam::recorder {

enum class RecorderState { kIdle, kRecording, kFinalizing };

const char* RecorderStateName(RecorderState state);

struct RecordingOptions {
  std::string               quality = "720p";
  std::chrono::milliseconds chunk_duration{std::chrono::minutes(5)};
  bool                      record_audio = true;

  static RecordingOptions FromSettings(const chunkcam::v1::Settings& settings);
};

/*
  Drives one capture device through a sequence of fixed-length takes.

    Idle -> Recording(i) -> Finalizing(i) -> Recording(i+1) -> ... -> Idle

  Every take is moved into the File Store, verified non-empty, wrapped in a
  Chunk and handed to the sink before the next take starts. Failures during
  a running session are reported through the error callback and end the
  session; chunks already handed to the sink are unaffected.

  The scheduler must outlive the recorder.
*/
class ChunkRecorder {
 public:
  using ErrorCallback = std::function<void(const std::string& message)>;
  using ChunkCallback = std::function<void(const model::Chunk& chunk)>;

  ChunkRecorder(std::shared_ptr<CaptureDevice> device, std::shared_ptr<ChunkSink> sink, std::shared_ptr<storage::FileStore> files,
                std::shared_ptr<util::TaskScheduler> scheduler, std::shared_ptr<util::ClockSource> clock, std::string device_id);
  ~ChunkRecorder();

  ChunkRecorder(const ChunkRecorder&)            = delete;
  ChunkRecorder& operator=(const ChunkRecorder&) = delete;

  void SetGalleryExporter(std::shared_ptr<GalleryExporter> exporter);
  void OnError(ErrorCallback callback);
  void OnChunkComplete(ChunkCallback callback);

  // Throws AlreadyRecordingError, ResourceExhausted (admission) or CaptureError.
  void Start(const RecordingOptions& options);

  // Finalizes the current chunk and returns once the recorder is Idle.
  // From a sink, gallery or chunk callback it only ends the session after
  // the chunk being finalized.
  void Stop();

  RecorderState                  State() const;
  bool                           IsRecording() const;
  uint32_t                       CurrentChunkIndex() const;
  std::optional<util::TimePoint> SessionStartedAt() const;

 private:
  struct Session {
    uint64_t                  generation = 0;
    bool                      active     = true;
    RecordingOptions          options;
    uint32_t                  chunk_index = 0;
    util::TimePoint           started_at;
    util::TimePoint           chunk_started_at;
    std::optional<TakeHandle> take;
    std::string               pending_chunk_base_name;
    util::TaskHandle          rotation_timer;
  };

  void        StartTakeLocked();
  void        CompleteCurrentChunk(bool rotate, uint64_t generation);
  model::Chunk PersistTake(const TakeResult& result, const std::string& base_name, uint32_t index, util::TimePoint chunk_started_at);
  std::string ChunkBaseName(util::TimePoint at, uint32_t index) const;
  void        ReportError(const std::string& message);

  std::shared_ptr<CaptureDevice>       device_;
  std::shared_ptr<ChunkSink>           sink_;
  std::shared_ptr<storage::FileStore>  files_;
  std::shared_ptr<util::TaskScheduler> scheduler_;
  std::shared_ptr<util::ClockSource>   clock_;
  std::string                          device_id_;

  std::shared_ptr<GalleryExporter> gallery_;
  ErrorCallback                    on_error_;
  ChunkCallback                    on_chunk_complete_;

  mutable std::mutex      mutex_;
  std::condition_variable idle_cv_;
  RecorderState           state_ = RecorderState::kIdle;
  std::optional<Session>  session_;
  uint64_t                next_generation_ = 1;

  // only one stop-current-chunk may be in flight
  bool            finalizing_ = false;
  std::thread::id finalizer_thread_;
};

} // namespace chunkcam::recorder
