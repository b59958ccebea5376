#pragma once

#include <grpcpp/channel.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "chunkcam/v1/ingest_service.grpc.pb.h"
#include "config/config.pb.h"
#include "internal/upload/upload_transport.hpp"

namespace chunkcam::grpc {

/*
  UploadTransport over ChunkIngestService.

  One upload is a CreateUploadSession call followed by a client stream whose
  first frame names the session and whose remaining frames carry the file in
  frame_bytes pieces. Progress is reported after every frame.

  The stream carries no deadline since chunk sizes vary widely; Shutdown()
  cancels it instead.
*/
class GrpcUploadTransport final : public upload::UploadTransport {
 public:
  static constexpr uint32_t kDefaultFrameBytes = 256 * 1024;

  GrpcUploadTransport(std::shared_ptr<::grpc::Channel> channel, std::string auth_token, uint32_t frame_bytes = kDefaultFrameBytes);

  static std::shared_ptr<GrpcUploadTransport> FromConfig(const chunkcam::runtime::config::UploadConfig& config);

  upload::UploadReceipt Upload(const upload::UploadRequest& request, const upload::ProgressCallback& on_progress) override;
  void                  Shutdown() override;

 private:
  // Keeps a call's context reachable from Shutdown() while it runs.
  class ActiveCall {
   public:
    ActiveCall(GrpcUploadTransport& owner, ::grpc::ClientContext* ctx);
    ~ActiveCall();

    ActiveCall(const ActiveCall&)            = delete;
    ActiveCall& operator=(const ActiveCall&) = delete;

   private:
    GrpcUploadTransport&   owner_;
    ::grpc::ClientContext* ctx_;
  };

  void Authorize(::grpc::ClientContext* ctx) const;

  std::unique_ptr<chunkcam::v1::ChunkIngestService::Stub> stub_;
  std::string                                             auth_token_;
  uint32_t                                                frame_bytes_;

  std::mutex                       calls_mutex_;
  std::set<::grpc::ClientContext*> calls_;
  bool                             shut_down_ = false;
};

} // namespace chunkcam::grpc
