#include <grpcpp/grpcpp.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "chunkcam/v1/ingest_service.grpc.pb.h"
#include "internal/db/memory/memory_kv_store.hpp"
#include "internal/grpc/grpc_upload_transport.hpp"
#include "internal/upload/upload_queue.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/test_support.hpp"

namespace {

namespace fs = std::filesystem;

using chunkcam::grpc::GrpcUploadTransport;
using chunkcam::testing::TempDir;
using chunkcam::testing::WriteFile;
using chunkcam::upload::UploadRequest;

using namespace std::chrono_literals;

/*
  In-process ingest endpoint. Records what it received and can be told to
  fail either RPC with a fixed status.
*/
class FakeIngestService final : public chunkcam::v1::ChunkIngestService::Service {
 public:
  ::grpc::Status CreateUploadSession(::grpc::ServerContext* ctx, const chunkcam::v1::CreateUploadSessionRequest* req,
                                     chunkcam::v1::CreateUploadSessionResponse* resp) override {
    std::lock_guard lock(mutex_);
    const auto      auth = ctx->client_metadata().find("authorization");
    if (auth != ctx->client_metadata().end()) last_authorization = std::string(auth->second.data(), auth->second.size());
    last_session = *req;

    if (!session_status.ok()) return session_status;

    resp->set_session_id("session-" + std::to_string(++sessions_));
    resp->set_remote_key("chunks/" + req->metadata().device_id() + "/" + req->file_name());
    return ::grpc::Status::OK;
  }

  ::grpc::Status UploadChunk(::grpc::ServerContext* ctx, ::grpc::ServerReader<chunkcam::v1::UploadChunkRequest>* reader,
                             chunkcam::v1::UploadChunkResponse* resp) override {
    if (hold_streams) {
      // never answers; only the client going away ends the call
      ++held_streams;
      while (!ctx->IsCancelled()) std::this_thread::sleep_for(5ms);
      return ::grpc::Status(::grpc::StatusCode::CANCELLED, "client went away");
    }

    chunkcam::v1::UploadChunkRequest frame;
    std::string                      session;
    uint64_t                         received = 0;
    uint64_t                         frames   = 0;

    while (reader->Read(&frame)) {
      if (frame.has_session_id()) {
        session = frame.session_id();
        continue;
      }
      received += frame.data().size();
      ++frames;
    }

    std::lock_guard lock(mutex_);
    if (session.empty()) return ::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT, "first frame must carry the session id");
    if (!stream_status.ok()) return stream_status;

    last_stream_bytes  = received;
    last_stream_frames = frames;
    resp->set_received_bytes(received - short_ack_bytes);
    return ::grpc::Status::OK;
  }

  std::mutex                               mutex_;
  ::grpc::Status                           session_status = ::grpc::Status::OK;
  ::grpc::Status                           stream_status  = ::grpc::Status::OK;
  uint64_t                                 short_ack_bytes = 0;
  std::string                              last_authorization;
  chunkcam::v1::CreateUploadSessionRequest last_session;
  uint64_t                                 last_stream_bytes  = 0;
  uint64_t                                 last_stream_frames = 0;
  std::atomic<bool>                        hold_streams{false};
  std::atomic<int>                         held_streams{0};

 private:
  int sessions_ = 0;
};

struct Server {
  FakeIngestService               service;
  std::unique_ptr<::grpc::Server> server;
  int                             port = 0;

  Server() {
    ::grpc::ServerBuilder builder;
    builder.AddListeningPort("127.0.0.1:0", ::grpc::InsecureServerCredentials(), &port);
    builder.RegisterService(&service);
    server = builder.BuildAndStart();
    assert(server && port > 0);
  }

  ~Server() {
    server->Shutdown(std::chrono::system_clock::now() + 1s);
  }

  std::shared_ptr<GrpcUploadTransport> Transport(const std::string& token = "", uint32_t frame_bytes = 4096) const {
    auto channel = ::grpc::CreateChannel("127.0.0.1:" + std::to_string(port), ::grpc::InsecureChannelCredentials());
    return std::make_shared<GrpcUploadTransport>(channel, token, frame_bytes);
  }
};

UploadRequest MakeRequest(const fs::path& path) {
  UploadRequest request;
  request.file_path    = path;
  request.file_name    = path.filename().string();
  request.size_bytes   = fs::file_size(path);
  request.content_type = "video/mp4";
  request.metadata.set_chunk_index(2);
  request.metadata.set_device_id("cam-7");
  request.metadata.set_platform("linux");
  return request;
}

chunkcam::util::UploadError UploadExpectingError(GrpcUploadTransport& transport, const UploadRequest& request) {
  try {
    transport.Upload(request, nullptr);
  } catch (const chunkcam::util::UploadError& e) {
    return e;
  }
  assert(false && "upload was expected to fail");
  return chunkcam::util::UploadError("unreachable", false);
}

void TestUploadStreamsFileWithProgress() {
  Server     server;
  TempDir    dir("chunkcam_grpc_transport");
  const auto path = WriteFile(dir.path() / "rec_cam-7_0.mp4", 10000);

  auto                  transport = server.Transport("s3cret", 4096);
  std::vector<uint32_t> progress;
  const auto            receipt = transport->Upload(MakeRequest(path), [&](uint32_t p) { progress.push_back(p); });

  assert(receipt.remote_reference == "chunks/cam-7/rec_cam-7_0.mp4");
  assert(progress == std::vector<uint32_t>({40, 81, 100}));

  std::lock_guard lock(server.service.mutex_);
  assert(server.service.last_authorization == "Bearer s3cret");
  assert(server.service.last_session.file_size_bytes() == 10000);
  assert(server.service.last_session.content_type() == "video/mp4");
  assert(server.service.last_session.metadata().chunk_index() == 2);
  assert(server.service.last_stream_bytes == 10000);
  assert(server.service.last_stream_frames == 3);
}

void TestRejectedSessionIsPermanent() {
  Server server;
  {
    std::lock_guard lock(server.service.mutex_);
    server.service.session_status = ::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT, "unsupported container");
  }

  TempDir    dir("chunkcam_grpc_transport");
  const auto path = WriteFile(dir.path() / "a.mp4", 100);

  auto       transport = server.Transport();
  const auto error     = UploadExpectingError(*transport, MakeRequest(path));
  assert(!error.retryable());
  assert(std::string(error.what()).find("unsupported container") != std::string::npos);
}

void TestUnavailableStreamIsRetryable() {
  Server server;
  {
    std::lock_guard lock(server.service.mutex_);
    server.service.stream_status = ::grpc::Status(::grpc::StatusCode::UNAVAILABLE, "ingest draining");
  }

  TempDir    dir("chunkcam_grpc_transport");
  const auto path = WriteFile(dir.path() / "a.mp4", 100);

  auto transport = server.Transport();
  assert(UploadExpectingError(*transport, MakeRequest(path)).retryable());
}

void TestShortAcknowledgementIsRetryable() {
  Server server;
  {
    std::lock_guard lock(server.service.mutex_);
    server.service.short_ack_bytes = 1;
  }

  TempDir    dir("chunkcam_grpc_transport");
  const auto path = WriteFile(dir.path() / "a.mp4", 100);

  auto transport = server.Transport();
  assert(UploadExpectingError(*transport, MakeRequest(path)).retryable());
}

void TestUnreachableEndpointIsRetryable() {
  TempDir    dir("chunkcam_grpc_transport");
  const auto path = WriteFile(dir.path() / "a.mp4", 100);

  // nothing listens on port 1
  auto channel = ::grpc::CreateChannel("127.0.0.1:1", ::grpc::InsecureChannelCredentials());
  GrpcUploadTransport transport(channel, "");
  assert(UploadExpectingError(transport, MakeRequest(path)).retryable());
}

void TestMissingFileIsPermanent() {
  Server  server;
  TempDir dir("chunkcam_grpc_transport");

  UploadRequest request;
  request.file_path = dir.path() / "gone.mp4";
  request.file_name = "gone.mp4";

  auto transport = server.Transport();
  assert(!UploadExpectingError(*transport, request).retryable());
}

void TestShutdownCancelsStalledStream() {
  Server server;
  server.service.hold_streams = true;

  TempDir    dir("chunkcam_grpc_transport");
  const auto path = WriteFile(dir.path() / "a.mp4", 100);

  auto                transport = server.Transport();
  std::optional<bool> retryable;
  std::thread         uploader([&] {
    try {
      transport->Upload(MakeRequest(path), nullptr);
    } catch (const chunkcam::util::UploadError& e) {
      retryable = e.retryable();
    }
  });

  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (server.service.held_streams.load() == 0) {
    assert(std::chrono::steady_clock::now() < deadline && "stream never reached the server");
    std::this_thread::sleep_for(1ms);
  }

  const auto cancelled_at = std::chrono::steady_clock::now();
  transport->Shutdown();
  uploader.join();

  assert(std::chrono::steady_clock::now() - cancelled_at < 5s);
  assert(retryable.has_value() && *retryable);

  // refused locally afterwards
  const auto error = UploadExpectingError(*transport, MakeRequest(path));
  assert(error.retryable());
  assert(server.service.held_streams.load() == 1);
}

void TestQueueUploadsThroughTransport() {
  Server  server;
  TempDir dir("chunkcam_grpc_transport");

  auto clock     = std::make_shared<chunkcam::testing::FakeClock>();
  auto files     = std::make_shared<chunkcam::storage::FileStore>(dir.path() / "recordings", clock);
  auto scheduler = std::make_shared<chunkcam::testing::ManualScheduler>();
  auto queue     = std::make_shared<chunkcam::upload::UploadQueue>(
      std::make_shared<chunkcam::db::memory::MemoryKeyValueStore>(), std::make_shared<chunkcam::testing::FakeSettingsStore>(), files,
      server.Transport(), std::make_shared<chunkcam::testing::FakeNetworkMonitor>(), scheduler, clock, "cam-7");

  const auto path  = WriteFile(dir.path() / "recordings" / "rec_cam-7_x_0.mp4", 5000);
  const auto chunk = chunkcam::model::Chunk::FromFile(path, 60000, 1714566605123ull, 0);
  const auto id    = queue->AddChunk(chunk);

  queue->ProcessQueue();

  const auto snapshot = queue->GetSnapshot();
  assert(snapshot.size() == 1);
  assert(snapshot[0].id() == id);
  assert(snapshot[0].status() == chunkcam::v1::UPLOAD_STATUS_COMPLETED);
  assert(snapshot[0].remote_reference() == "chunks/cam-7/rec_cam-7_x_0.mp4");
  assert(!fs::exists(path));

  std::lock_guard lock(server.service.mutex_);
  assert(server.service.last_session.metadata().device_id() == "cam-7");
  assert(server.service.last_session.metadata().platform() == "linux");
  assert(server.service.last_session.metadata().duration_ms() == 60000);
}

} // namespace

int main() {
  TestUploadStreamsFileWithProgress();
  TestRejectedSessionIsPermanent();
  TestUnavailableStreamIsRetryable();
  TestShortAcknowledgementIsRetryable();
  TestUnreachableEndpointIsRetryable();
  TestMissingFileIsPermanent();
  TestShutdownCancelsStalledStream();
  TestQueueUploadsThroughTransport();

  std::cout << "chunkcam_integration_grpc_upload_transport: pass\n";
  return 0;
}
