#include "internal/grpc/grpc_upload_transport.hpp"

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "internal/grpc/grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace chunkcam::grpc {

namespace {

constexpr auto kSessionDeadline = std::chrono::seconds(30);

uint32_t Percent(uint64_t sent, uint64_t total) {
  if (total == 0) return 100;
  return static_cast<uint32_t>(sent * 100 / total);
}

} // namespace

GrpcUploadTransport::GrpcUploadTransport(std::shared_ptr<::grpc::Channel> channel, std::string auth_token, uint32_t frame_bytes)
    : stub_(chunkcam::v1::ChunkIngestService::NewStub(std::move(channel))), auth_token_(std::move(auth_token)),
      frame_bytes_(frame_bytes == 0 ? kDefaultFrameBytes : frame_bytes) {
}

std::shared_ptr<GrpcUploadTransport> GrpcUploadTransport::FromConfig(const chunkcam::runtime::config::UploadConfig& config) {
  if (config.endpoint().empty()) {
    throw std::invalid_argument("upload.endpoint is required");
  }

  auto credentials = config.use_tls() ? ::grpc::SslCredentials(::grpc::SslCredentialsOptions{}) : ::grpc::InsecureChannelCredentials();
  auto channel     = ::grpc::CreateChannel(config.endpoint(), credentials);
  return std::make_shared<GrpcUploadTransport>(std::move(channel), config.auth_token(), config.frame_bytes());
}

GrpcUploadTransport::ActiveCall::ActiveCall(GrpcUploadTransport& owner, ::grpc::ClientContext* ctx) : owner_(owner), ctx_(ctx) {
  std::lock_guard lock(owner_.calls_mutex_);
  if (owner_.shut_down_) throw util::UploadError("upload transport is shut down", true);
  owner_.calls_.insert(ctx_);
}

GrpcUploadTransport::ActiveCall::~ActiveCall() {
  std::lock_guard lock(owner_.calls_mutex_);
  owner_.calls_.erase(ctx_);
}

void GrpcUploadTransport::Shutdown() {
  std::lock_guard lock(calls_mutex_);
  if (shut_down_) return;
  shut_down_ = true;

  CHUNKCAM_LOG_INFO("cancelling uploads in flight", {observability::IntField("calls", static_cast<int64_t>(calls_.size()))});
  for (auto* ctx : calls_) ctx->TryCancel();
}

void GrpcUploadTransport::Authorize(::grpc::ClientContext* ctx) const {
  if (!auth_token_.empty()) {
    ctx->AddMetadata("authorization", "Bearer " + auth_token_);
  }
}

upload::UploadReceipt GrpcUploadTransport::Upload(const upload::UploadRequest& request, const upload::ProgressCallback& on_progress) {
  std::ifstream in(request.file_path, std::ios::binary);
  if (!in) {
    throw util::UploadError("cannot open " + request.file_path.string(), false);
  }

  chunkcam::v1::CreateUploadSessionRequest  session_req;
  chunkcam::v1::CreateUploadSessionResponse session_resp;
  session_req.set_file_name(request.file_name);
  session_req.set_file_size_bytes(request.size_bytes);
  session_req.set_content_type(request.content_type);
  *session_req.mutable_metadata() = request.metadata;

  {
    ::grpc::ClientContext ctx;
    ActiveCall            active(*this, &ctx);
    Authorize(&ctx);
    ctx.set_deadline(std::chrono::system_clock::now() + kSessionDeadline);

    const auto status = stub_->CreateUploadSession(&ctx, session_req, &session_resp);
    if (!status.ok()) throw ToUploadError(status, "CreateUploadSession");
  }

  ::grpc::ClientContext              ctx;
  chunkcam::v1::UploadChunkResponse response;
  ActiveCall                         active(*this, &ctx);
  Authorize(&ctx);
  auto writer = stub_->UploadChunk(&ctx, &response);

  chunkcam::v1::UploadChunkRequest frame;
  frame.set_session_id(session_resp.session_id());

  bool stream_ok = writer->Write(frame);

  std::vector<char> buffer(frame_bytes_);
  uint64_t          sent = 0;
  while (stream_ok && in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto n = in.gcount();
    if (n <= 0) break;

    frame.set_data(buffer.data(), static_cast<size_t>(n));
    stream_ok = writer->Write(frame);
    if (!stream_ok) break;

    sent += static_cast<uint64_t>(n);
    if (on_progress) on_progress(Percent(sent, request.size_bytes));
  }

  const bool read_failed = in.bad();
  if (read_failed) ctx.TryCancel();

  // A broken stream surfaces its real status from Finish.
  if (stream_ok && !read_failed) writer->WritesDone();
  const auto status = writer->Finish();
  if (read_failed) throw util::UploadError("read failed for " + request.file_path.string() + ": " + status.error_message(), true);
  if (!status.ok()) throw ToUploadError(status, "UploadChunk");

  if (response.received_bytes() != sent) {
    throw util::UploadError("remote acknowledged " + std::to_string(response.received_bytes()) + " of " + std::to_string(sent) + " bytes", true);
  }

  CHUNKCAM_LOG_DEBUG("upload stream finished", {observability::StringField("file", request.file_name),
                                                observability::IntField("bytes", static_cast<int64_t>(sent))});

  upload::UploadReceipt receipt;
  receipt.remote_reference = response.remote_key().empty() ? session_resp.remote_key() : response.remote_key();
  return receipt;
}

} // namespace chunkcam::grpc
