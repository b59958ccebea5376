#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include "chunkcam/v1/queue.pb.h"

namespace chunkcam::upload {

struct UploadRequest {
  std::filesystem::path       file_path;
  std::string                 file_name;
  uint64_t                    size_bytes = 0;
  std::string                 content_type;
  chunkcam::v1::ChunkMetadata metadata;
};

struct UploadReceipt {
  std::string remote_reference;
};

using ProgressCallback = std::function<void(uint32_t percent)>;

/*
  Sends one chunk file to the remote endpoint.

  Blocks until the remote side has acknowledged the whole file. Progress is
  reported in whole percent, non-decreasing. Failures throw
  util::UploadError; retryable() separates transient from permanent.
*/
class UploadTransport {
 public:
  virtual ~UploadTransport() = default;

  virtual UploadReceipt Upload(const UploadRequest& request, const ProgressCallback& on_progress) = 0;

  // Cancels uploads in flight and refuses new ones, both with a retryable
  // UploadError. Safe from any thread.
  virtual void Shutdown() = 0;
};

} // namespace chunkcam::upload
