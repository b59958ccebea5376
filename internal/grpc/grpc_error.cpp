#include "grpc_error.hpp"

#include <string>

namespace chunkcam::grpc {

bool IsRetryable(::grpc::StatusCode code) {
  switch (code) {
    case ::grpc::StatusCode::INVALID_ARGUMENT:
    case ::grpc::StatusCode::FAILED_PRECONDITION:
    case ::grpc::StatusCode::PERMISSION_DENIED:
    case ::grpc::StatusCode::UNAUTHENTICATED:
    case ::grpc::StatusCode::OUT_OF_RANGE:
    case ::grpc::StatusCode::ALREADY_EXISTS:
    case ::grpc::StatusCode::UNIMPLEMENTED:
      return false;
    default:
      return true;
  }
}

util::UploadError ToUploadError(const ::grpc::Status& status, std::string_view action) {
  return util::UploadError(std::string(action) + " failed (code " + std::to_string(static_cast<int>(status.error_code())) + "): " + status.error_message(),
                           IsRetryable(status.error_code()));
}

} // namespace chunkcam::grpc
