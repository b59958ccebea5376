#include "internal/recorder/chunk_recorder.hpp"

#include <exception>
#include <thread>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/non_critical.hpp"

namespace chunkcam::recorder {

namespace {

constexpr const char* kDefaultExtension = ".mp4";

uint32_t DurationMinutes(std::chrono::milliseconds duration) {
  const auto minutes = std::chrono::ceil<std::chrono::minutes>(duration).count();
  return minutes > 0 ? static_cast<uint32_t>(minutes) : 1u;
}

} // namespace

const char* RecorderStateName(RecorderState state) {
  switch (state) {
    case RecorderState::kIdle:
      return "idle";
    case RecorderState::kRecording:
      return "recording";
    case RecorderState::kFinalizing:
      return "finalizing";
  }
  return "unknown";
}

RecordingOptions RecordingOptions::FromSettings(const chunkcam::v1::Settings& settings) {
  RecordingOptions options;
  options.quality        = settings.video_quality();
  options.chunk_duration = std::chrono::minutes(settings.chunk_duration_minutes());
  options.record_audio   = settings.record_audio();
  return options;
}

ChunkRecorder::ChunkRecorder(std::shared_ptr<CaptureDevice> device, std::shared_ptr<ChunkSink> sink, std::shared_ptr<storage::FileStore> files,
                             std::shared_ptr<util::TaskScheduler> scheduler, std::shared_ptr<util::ClockSource> clock, std::string device_id)
    : device_(std::move(device)), sink_(std::move(sink)), files_(std::move(files)), scheduler_(std::move(scheduler)), clock_(std::move(clock)),
      device_id_(std::move(device_id)) {
}

ChunkRecorder::~ChunkRecorder() {
  Stop();
}

void ChunkRecorder::SetGalleryExporter(std::shared_ptr<GalleryExporter> exporter) {
  std::lock_guard lock(mutex_);
  gallery_ = std::move(exporter);
}

void ChunkRecorder::OnError(ErrorCallback callback) {
  std::lock_guard lock(mutex_);
  on_error_ = std::move(callback);
}

void ChunkRecorder::OnChunkComplete(ChunkCallback callback) {
  std::lock_guard lock(mutex_);
  on_chunk_complete_ = std::move(callback);
}

void ChunkRecorder::Start(const RecordingOptions& options) {
  std::lock_guard lock(mutex_);

  if (state_ != RecorderState::kIdle) {
    throw util::AlreadyRecordingError("recorder is " + std::string(RecorderStateName(state_)));
  }

  const uint64_t estimate = storage::FileStore::EstimateChunkBytes(DurationMinutes(options.chunk_duration), options.quality);
  if (!files_->HasEnoughSpace(estimate)) {
    throw util::ResourceExhausted("insufficient storage space to start recording");
  }

  Session session;
  session.generation = next_generation_++;
  session.options    = options;
  session.started_at = clock_->Now();
  session_           = std::move(session);

  try {
    StartTakeLocked();
  } catch (const std::exception& e) {
    session_.reset();
    throw util::CaptureError(std::string("failed to start recording: ") + e.what());
  }

  state_ = RecorderState::kRecording;

  CHUNKCAM_LOG_INFO("recording started", {observability::StringField("quality", options.quality),
                                          observability::IntField("chunk_duration_ms", options.chunk_duration.count()),
                                          observability::BoolField("record_audio", options.record_audio)});
}

void ChunkRecorder::Stop() {
  uint64_t generation = 0;
  {
    std::lock_guard lock(mutex_);
    if (!session_) return;

    session_->active = false;
    session_->rotation_timer.Cancel();
    generation = session_->generation;

    // called back from the chunk being finalized; that path ends the session
    if (finalizing_ && finalizer_thread_ == std::this_thread::get_id()) {
      CHUNKCAM_LOG_INFO("recording stop requested while finalizing");
      return;
    }
  }

  CompleteCurrentChunk(false, generation);

  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return !session_ || session_->generation != generation; });

  CHUNKCAM_LOG_INFO("recording stopped");
}

RecorderState ChunkRecorder::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

bool ChunkRecorder::IsRecording() const {
  std::lock_guard lock(mutex_);
  return state_ != RecorderState::kIdle;
}

uint32_t ChunkRecorder::CurrentChunkIndex() const {
  std::lock_guard lock(mutex_);
  return session_ ? session_->chunk_index : 0;
}

std::optional<util::TimePoint> ChunkRecorder::SessionStartedAt() const {
  std::lock_guard lock(mutex_);
  if (!session_) return std::nullopt;
  return session_->started_at;
}

void ChunkRecorder::StartTakeLocked() {
  Session& session = *session_;

  TakeOptions take_options;
  take_options.quality              = session.options.quality;
  take_options.max_duration_seconds = static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::seconds>(session.options.chunk_duration).count());
  take_options.mute_audio           = !session.options.record_audio;

  session.take                    = device_->StartTake(take_options);
  session.chunk_started_at        = clock_->Now();
  session.pending_chunk_base_name = ChunkBaseName(session.chunk_started_at, session.chunk_index);

  const uint64_t generation = session.generation;
  session.rotation_timer    = scheduler_->Schedule(session.options.chunk_duration, [this, generation] { CompleteCurrentChunk(true, generation); });
}

void ChunkRecorder::CompleteCurrentChunk(bool rotate, uint64_t generation) {
  TakeHandle      take = 0;
  std::string     base_name;
  uint32_t        index = 0;
  util::TimePoint chunk_started_at;

  {
    std::lock_guard lock(mutex_);

    if (finalizing_) return;
    if (!session_ || session_->generation != generation) return;
    if (rotate && !session_->active) return;

    if (!session_->take) {
      session_.reset();
      state_ = RecorderState::kIdle;
      idle_cv_.notify_all();
      return;
    }

    finalizing_       = true;
    finalizer_thread_ = std::this_thread::get_id();
    state_            = RecorderState::kFinalizing;

    take             = *session_->take;
    base_name        = session_->pending_chunk_base_name;
    index            = session_->chunk_index;
    chunk_started_at = session_->chunk_started_at;
    session_->take.reset();
  }

  std::optional<std::string> error;
  try {
    const TakeResult   result = device_->StopTake(take);
    const model::Chunk chunk  = PersistTake(result, base_name, index, chunk_started_at);

    sink_->Enqueue(chunk);

    std::shared_ptr<GalleryExporter> gallery;
    ChunkCallback                    on_complete;
    {
      std::lock_guard lock(mutex_);
      gallery     = gallery_;
      on_complete = on_chunk_complete_;
    }
    if (gallery) {
      util::RunNonCritical("gallery_export", [&] { gallery->Export(chunk); });
    }
    if (on_complete) {
      util::RunNonCritical("chunk_complete_callback", [&] { on_complete(chunk); });
    }

    CHUNKCAM_LOG_INFO("chunk finalized", {observability::StringField("file", chunk.file_name()),
                                          observability::IntField("index", chunk.sequence_index()),
                                          observability::IntField("size_bytes", static_cast<int64_t>(chunk.size_bytes()))});
  } catch (const std::exception& e) {
    error = e.what();
  }

  {
    std::lock_guard lock(mutex_);
    finalizing_       = false;
    finalizer_thread_ = std::thread::id();

    bool continuing = false;
    if (!error && session_ && session_->generation == generation && session_->active) {
      session_->chunk_index++;
      try {
        StartTakeLocked();
        state_     = RecorderState::kRecording;
        continuing = true;
      } catch (const std::exception& e) {
        error = std::string("failed to start next chunk: ") + e.what();
      }
    }

    if (!continuing) {
      session_.reset();
      state_ = RecorderState::kIdle;
    }
    idle_cv_.notify_all();
  }

  if (error) ReportError(*error);
}

model::Chunk ChunkRecorder::PersistTake(const TakeResult& result, const std::string& base_name, uint32_t index, util::TimePoint chunk_started_at) {
  std::string extension = result.output_path.extension().string();
  if (extension.empty()) extension = kDefaultExtension;

  const auto moved = files_->Adopt(result.output_path, base_name + extension);

  const auto now         = clock_->Now();
  const auto duration_ms = now > chunk_started_at ? std::chrono::duration_cast<std::chrono::milliseconds>(now - chunk_started_at).count() : 0;

  return model::Chunk::FromFile(moved, static_cast<uint64_t>(duration_ms), util::ToUnixMillis(chunk_started_at), index);
}

std::string ChunkRecorder::ChunkBaseName(util::TimePoint at, uint32_t index) const {
  return "rec_" + device_id_ + "_" + util::ToFileSafeIso8601(at) + "_" + std::to_string(index);
}

void ChunkRecorder::ReportError(const std::string& message) {
  CHUNKCAM_LOG_ERROR("recording failed", {observability::StringField("error", message)});

  ErrorCallback callback;
  {
    std::lock_guard lock(mutex_);
    callback = on_error_;
  }
  if (callback) callback(message);
}

} // namespace chunkcam::recorder
